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


#include "SampleMap.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

SampleMap SampleMap::from_all(const std::vector<std::string>& samples) {
    SampleMap map;
    for (const auto& sample : samples) {
        map.insert(sample, Population());
    }
    return map;
}

SampleMap SampleMap::from_pairs(const std::vector<std::pair<std::string, Population>>& pairs) {
    SampleMap map;
    for (const auto& pair : pairs) {
        map.insert(pair.first, pair.second);
    }
    return map;
}

SampleMap SampleMap::from_stream(std::istream& input) {
    SampleMap map;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        std::size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            map.insert(line, Population());
        } else {
            map.insert(line.substr(0, tab), Population(line.substr(tab + 1)));
        }
    }
    if (input.bad()) {
        throw SampleMapError("I/O error while reading samples");
    }
    return map;
}

SampleMap SampleMap::from_path(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        std::ostringstream oss;
        oss << "Unable to open samples file " << path;
        throw SampleMapError(oss.str());
    }
    return from_stream(file);
}

void SampleMap::insert(const std::string& sample, const Population& population) {
    if (sample_index.count(sample) > 0) {
        std::ostringstream oss;
        oss << "Sample " << sample << " is defined more than once";
        throw SampleMapError(oss.str());
    }

    auto it = std::find(population_names.begin(), population_names.end(), population);
    std::size_t population_id = static_cast<std::size_t>(it - population_names.begin());
    if (it == population_names.end()) {
        population_names.push_back(population);
    }

    sample_index[sample] = sample_names.size();
    sample_names.push_back(sample);
    population_ids.push_back(population_id);
}

std::optional<std::size_t> SampleMap::get_population_id(const std::string& sample) const {
    auto it = sample_index.find(sample);
    if (it == sample_index.end()) {
        return std::nullopt;
    }
    return population_ids[it->second];
}

const std::string* SampleMap::get_sample(std::size_t id) const {
    return id < sample_names.size() ? &sample_names[id] : nullptr;
}

std::optional<std::size_t> SampleMap::get_sample_id(const std::string& sample) const {
    auto it = sample_index.find(sample);
    if (it == sample_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::size_t> SampleMap::population_sizes() const {
    std::vector<std::size_t> sizes(population_names.size(), 0);
    for (auto id : population_ids) {
        sizes[id]++;
    }
    return sizes;
}

Shape SampleMap::shape() const {
    std::vector<std::size_t> dims;
    for (auto size : population_sizes()) {
        dims.push_back(1 + 2 * size);
    }
    return Shape(dims);
}
