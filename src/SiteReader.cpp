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


#include "SiteReader.hpp"

#include <sstream>
#include <unordered_set>

void Site::add_to(Scs& scs) const {
    switch (kind) {
    case Kind::Standard:
        scs += *counts;
        break;
    case Kind::Projected:
        projection->project_to_weighted(*totals, *counts, scs.inner_mut(), 1.0);
        break;
    case Kind::InsufficientData:
        break;
    }
}

SiteReader::SiteReader(std::unique_ptr<GenotypeReader> _reader, SampleMap _sample_map,
                       std::optional<Shape> project_to)
    : reader(std::move(_reader)), map(std::move(_sample_map)) {
    if (map.empty()) {
        throw SampleMapError("Cannot read sites with an empty sample map");
    }

    const std::vector<std::string>& names = reader->samples();
    std::unordered_set<std::string> known(names.begin(), names.end());
    for (const auto& sample : map.samples()) {
        if (known.count(sample) == 0) {
            std::ostringstream oss;
            oss << "Sample " << sample << " not found in input";
            throw SampleMapError(oss.str());
        }
    }

    if (project_to) {
        check_projection(map.shape(), *project_to);
        partial_projection.emplace(*project_to);
    }

    reader_samples.reserve(names.size());
    for (const auto& name : names) {
        auto population_id = map.get_population_id(name);
        if (population_id) {
            reader_samples.push_back(MappedSample{*population_id, *map.get_sample_id(name)});
        } else {
            reader_samples.push_back(std::nullopt);
        }
    }

    counts = Count::from_zeros(map.number_of_populations());
    totals = Count::from_zeros(map.number_of_populations());
}

Scs SiteReader::create_zero_scs() const {
    if (partial_projection) {
        return Scs::from_zeros(partial_projection->project_to());
    }
    return Scs::from_zeros(map.shape());
}

void SiteReader::reset() {
    counts.set_zero();
    totals.set_zero();
    skipped_samples.clear();
}

ReadStatus SiteReader::read_site(Site& site) {
    reset();

    ReadStatus status = reader->read_genotypes(genotypes);
    if (status == ReadStatus::Error) {
        error_message = reader->error();
        return status;
    }
    if (status == ReadStatus::Done) {
        return status;
    }
    if (genotypes.size() != reader_samples.size()) {
        std::ostringstream oss;
        oss << "Expected " << reader_samples.size() << " genotypes at "
            << reader->current_contig() << ":" << reader->current_position() << ", found "
            << genotypes.size();
        error_message = oss.str();
        return ReadStatus::Error;
    }

    for (std::size_t i = 0; i < genotypes.size(); i++) {
        if (!reader_samples[i]) {
            continue;
        }
        const MappedSample& sample = *reader_samples[i];
        const GenotypeResult& genotype = genotypes[i];

        switch (genotype.kind()) {
        case GenotypeResult::Kind::Genotype:
            counts[sample.population_id] += static_cast<std::size_t>(genotype.genotype());
            totals[sample.population_id] += 2;
            break;
        case GenotypeResult::Kind::Skipped:
            skipped_samples.emplace_back(sample.sample_id, genotype.skipped());
            break;
        case GenotypeResult::Kind::Error: {
            std::ostringstream oss;
            oss << "Invalid genotype for sample " << reader->samples()[i] << " at "
                << reader->current_contig() << ":" << reader->current_position() << ": "
                << genotype_error_reason(genotype.error());
            error_message = oss.str();
            return ReadStatus::Error;
        }
        }
    }

    site.counts = &counts;
    site.totals = &totals;
    site.projection = nullptr;

    if (partial_projection) {
        const Count& target = partial_projection->target_alleles();
        bool exact = true;
        bool projectable = true;
        for (std::size_t i = 0; i < totals.dimensions(); i++) {
            exact = exact && totals[i] == target[i];
            projectable = projectable && totals[i] >= target[i];
        }

        if (exact) {
            site.kind = Site::Kind::Standard;
        } else if (projectable) {
            site.kind = Site::Kind::Projected;
            site.projection = &*partial_projection;
        } else {
            site.kind = Site::Kind::InsufficientData;
        }
    } else if (skipped_samples.empty()) {
        site.kind = Site::Kind::Standard;
    } else {
        site.kind = Site::Kind::InsufficientData;
    }
    return ReadStatus::Read;
}
