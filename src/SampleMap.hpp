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


#ifndef SFS_SAMPLE_MAP_HPP
#define SFS_SAMPLE_MAP_HPP

#include "Shape.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

class SampleMapError : public std::runtime_error {
public:
    explicit SampleMapError(const std::string& message) : std::runtime_error(message) {}
};

/// A population, either named or the single unnamed population
class Population {
public:
    Population() = default;
    Population(std::string _name) : name(std::move(_name)) {}
    Population(const char* _name) : name(std::string(_name)) {}

    bool is_named() const { return name.has_value(); }
    std::string to_string() const { return name ? *name : "[unnamed]"; }

    bool operator==(const Population& other) const { return name == other.name; }
    bool operator!=(const Population& other) const { return name != other.name; }

public:
    std::optional<std::string> name;
};

/// Insertion-ordered mapping from sample names to population ids. Population ids are assigned in
/// order of first appearance, so population 0 is the population of the first sample.
class SampleMap {
public:
    SampleMap() = default;

    /// Map every sample to the unnamed population
    static SampleMap from_all(const std::vector<std::string>& samples);
    static SampleMap from_pairs(const std::vector<std::pair<std::string, Population>>& pairs);
    /// Parse a samples file: one sample per line, optionally followed by a tab and a population
    static SampleMap from_stream(std::istream& input);
    static SampleMap from_path(const std::string& path);

    /// Throws SampleMapError if the sample is already mapped
    void insert(const std::string& sample, const Population& population);

    std::optional<std::size_t> get_population_id(const std::string& sample) const;
    /// Sample name with the given id, or nullptr
    const std::string* get_sample(std::size_t id) const;
    std::optional<std::size_t> get_sample_id(const std::string& sample) const;

    bool empty() const { return sample_names.empty(); }
    std::size_t size() const { return sample_names.size(); }
    std::size_t number_of_populations() const { return population_names.size(); }
    /// Number of samples per population id
    std::vector<std::size_t> population_sizes() const;
    const std::vector<Population>& populations() const { return population_names; }
    const std::vector<std::string>& samples() const { return sample_names; }

    /// Spectrum shape, with 2n + 1 cells for a population of n diploid samples
    Shape shape() const;

private:
    std::vector<std::string> sample_names;
    std::vector<std::size_t> population_ids;
    std::unordered_map<std::string, std::size_t> sample_index;
    std::vector<Population> population_names;
};

#endif // SFS_SAMPLE_MAP_HPP
