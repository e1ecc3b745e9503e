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

#ifndef SFS_COUNT_HPP
#define SFS_COUNT_HPP

#include "Shape.hpp"

#include <cstddef>
#include <vector>

/// Per-population allele counts. Used both as an index into a spectrum and as the per-site
/// accumulator while reading genotypes.
class Count {
public:
    Count() = default;
    Count(std::vector<std::size_t> _values) : values(std::move(_values)) {}
    Count(std::initializer_list<std::size_t> _values) : values(_values) {}

    static Count from_zeros(std::size_t dimensions);
    /// Maximum index of a shape, i.e. every dimension minus one
    static Count from_shape(const Shape& shape);
    /// Inverse of from_shape
    Shape into_shape() const;

    std::size_t dimensions() const { return values.size(); }
    void set_zero();

    std::size_t& operator[](std::size_t i) { return values[i]; }
    std::size_t operator[](std::size_t i) const { return values[i]; }
    std::vector<std::size_t>::const_iterator begin() const { return values.begin(); }
    std::vector<std::size_t>::const_iterator end() const { return values.end(); }

    bool operator==(const Count& other) const { return values == other.values; }
    bool operator!=(const Count& other) const { return values != other.values; }

public:
    std::vector<std::size_t> values;
};

#endif // SFS_COUNT_HPP
