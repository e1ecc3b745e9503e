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


#include "SpectrumCreator.hpp"

#include <sstream>

SpectrumCreator::SpectrumCreator(SiteReader& _site_reader, bool _strict, std::ostream& _log)
    : site_reader(_site_reader), strict(_strict), log(_log) {
}

Scs SpectrumCreator::run() {
    Scs scs = site_reader.create_zero_scs();
    Site site;

    while (true) {
        ReadStatus status = site_reader.read_site(site);
        if (status == ReadStatus::Done) {
            break;
        }
        if (status == ReadStatus::Error) {
            throw GenotypeReaderError(site_reader.error());
        }
        num_sites_read++;

        if (site.kind == Site::Kind::InsufficientData) {
            drop_site();
        } else {
            site.add_to(scs);
        }
    }

    summarize();
    return scs;
}

void SpectrumCreator::drop_site() {
    const auto& skipped = site_reader.current_skipped_samples();

    if (strict) {
        std::ostringstream oss;
        oss << "Insufficient data at position '" << site_reader.current_contig() << ":"
            << site_reader.current_position() << "'";
        if (!skipped.empty()) {
            const std::string* sample = site_reader.sample_map().get_sample(skipped.front().first);
            oss << ": sample " << (sample ? *sample : "?") << " has "
                << skipped_reason(skipped.front().second);
        }
        throw StrictModeError(oss.str());
    }

    num_sites_dropped++;

    // Count each reason at most once per site
    std::array<bool, NUM_SKIPPED_REASONS> seen{};
    for (const auto& pair : skipped) {
        auto i = static_cast<std::size_t>(pair.second);
        if (!seen[i]) {
            seen[i] = true;
            warn_once(pair.second);
        }
    }
}

void SpectrumCreator::warn_once(Skipped reason) {
    std::size_t& count = skipped_counts[static_cast<std::size_t>(reason)];
    if (count == 0) {
        log << "Warning: Skipping record at position '" << site_reader.current_contig() << ":"
            << site_reader.current_position() << "' due to " << skipped_reason(reason)
            << ". This error will be shown only once, with a summary at the end." << std::endl;
    }
    count++;
}

void SpectrumCreator::summarize() {
    for (std::size_t i = 0; i < NUM_SKIPPED_REASONS; i++) {
        if (skipped_counts[i] > 0) {
            log << "Warning: Skipped " << skipped_counts[i] << " records due to "
                << skipped_reason(static_cast<Skipped>(i)) << "." << std::endl;
        }
    }
}
