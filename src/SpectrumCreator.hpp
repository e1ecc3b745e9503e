// This file is part of the sfs software suite.
// Copyright (C) 2025 sfs Developers.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.


#ifndef SFS_SPECTRUM_CREATOR_HPP
#define SFS_SPECTRUM_CREATOR_HPP

#include "Genotype.hpp"
#include "SiteReader.hpp"
#include "Spectrum.hpp"

#include <array>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>

/// A dropped site in strict mode
class StrictModeError : public std::runtime_error {
public:
    explicit StrictModeError(const std::string& message) : std::runtime_error(message) {}
};

/// Reads every site from a SiteReader into a count spectrum.
///
/// Sites with insufficient data are dropped with a warning, printed once per distinct reason and
/// summarized at the end of the run. In strict mode the first such site throws StrictModeError.
/// Reader errors throw GenotypeReaderError in either mode.
class SpectrumCreator {
public:
    SpectrumCreator(SiteReader& _site_reader, bool _strict = false, std::ostream& _log = std::cerr);

    Scs run();

    std::size_t skipped_count(Skipped reason) const {
        return skipped_counts[static_cast<std::size_t>(reason)];
    }

public:
    std::size_t num_sites_read = 0;
    std::size_t num_sites_dropped = 0;

private:
    void drop_site();
    void warn_once(Skipped reason);
    void summarize();

    SiteReader& site_reader;
    bool strict = false;
    std::ostream& log;
    std::array<std::size_t, NUM_SKIPPED_REASONS> skipped_counts{};
};

#endif // SFS_SPECTRUM_CREATOR_HPP
