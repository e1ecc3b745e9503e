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


#ifndef SFS_SITE_READER_HPP
#define SFS_SITE_READER_HPP

#include "Count.hpp"
#include "Genotype.hpp"
#include "GenotypeReader.hpp"
#include "Projection.hpp"
#include "SampleMap.hpp"
#include "Shape.hpp"
#include "Spectrum.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/// One site as classified by a SiteReader. The pointers refer to the reader's internal state and
/// are invalidated by the next read.
class Site {
public:
    enum class Kind {
        Standard,        ///< Counts index the output spectrum directly
        Projected,       ///< Counts are spread over the output spectrum by projection
        InsufficientData ///< Too few called genotypes, dropped
    };

    /// Add this site to a spectrum with the reader's output shape. Does nothing for
    /// InsufficientData.
    void add_to(Scs& scs) const;

public:
    Kind kind = Kind::InsufficientData;
    const Count* counts = nullptr;
    const Count* totals = nullptr;
    PartialProjection* projection = nullptr;
};

/// Turns per-sample genotypes into per-population allele counts, one site at a time.
class SiteReader {
public:
    /// Throws SampleMapError if the map is empty or names a sample the reader does not have, and
    /// ProjectionError if `project_to` is not a valid projection of the sample map's shape.
    SiteReader(std::unique_ptr<GenotypeReader> _reader, SampleMap _sample_map,
               std::optional<Shape> project_to = std::nullopt);

    /// Zero spectrum with the output shape: the projection target if any, otherwise the shape of
    /// the sample map
    Scs create_zero_scs() const;

    /// Read and classify the next site. Status Error covers both reader failures and structurally
    /// invalid genotypes, with details in error().
    ReadStatus read_site(Site& site);

    const std::string& current_contig() const { return reader->current_contig(); }
    std::size_t current_position() const { return reader->current_position(); }

    /// Skipped mapped samples at the current site, as (sample id, reason)
    const std::vector<std::pair<std::size_t, Skipped>>& current_skipped_samples() const {
        return skipped_samples;
    }

    const std::vector<std::string>& samples() const { return reader->samples(); }
    const SampleMap& sample_map() const { return map; }
    const std::optional<PartialProjection>& projection() const { return partial_projection; }
    const std::string& error() const { return error_message; }

private:
    void reset();

    // Population and sample id for each reader sample, if mapped
    struct MappedSample {
        std::size_t population_id;
        std::size_t sample_id;
    };

    std::unique_ptr<GenotypeReader> reader;
    SampleMap map;
    std::vector<std::optional<MappedSample>> reader_samples;
    std::optional<PartialProjection> partial_projection;
    Count counts;
    Count totals;
    std::vector<GenotypeResult> genotypes;
    std::vector<std::pair<std::size_t, Skipped>> skipped_samples;
    std::string error_message;
};

#endif // SFS_SITE_READER_HPP
