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

#ifndef SFS_SHAPE_HPP
#define SFS_SHAPE_HPP

#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/// Index of a dimension in an array or spectrum
using Axis = std::size_t;

class Strides;

/// The extent of an N-dimensional array, one entry per dimension. For a spectrum over a
/// population of m diploid individuals the corresponding entry is 2m + 1.
class Shape {
public:
    Shape() = default;
    Shape(std::vector<std::size_t> _dims);
    Shape(std::initializer_list<std::size_t> _dims) : dims(_dims) {}

    /// Shape of a spectrum over the given number of diploid individuals per population
    static Shape from_individuals(const std::vector<std::size_t>& individuals);

    std::size_t dimensions() const { return dims.size(); }
    /// Throws ShapeError if the product of the dimensions overflows
    std::size_t elements() const;
    const std::vector<std::size_t>& values() const { return dims; }

    std::size_t operator[](std::size_t i) const { return dims[i]; }
    std::size_t at(std::size_t i) const { return dims.at(i); }
    std::vector<std::size_t>::const_iterator begin() const { return dims.begin(); }
    std::vector<std::size_t>::const_iterator end() const { return dims.end(); }

    /// Row-major offset multipliers
    Strides strides() const;

    /// Flat row-major offset of a multi-index, or nothing if the index has the wrong length
    /// or is out of bounds.
    std::optional<std::size_t> flat_index(const std::vector<std::size_t>& index) const;

    // These assume flat < elements()
    std::vector<std::size_t> index_from_flat(std::size_t flat) const;
    std::size_t index_sum_from_flat(std::size_t flat) const;

    Shape remove_axis(Axis axis) const;

    /// Slash-separated representation, e.g. "3/5/7"
    std::string to_string() const;

    bool operator==(const Shape& other) const { return dims == other.dims; }
    bool operator!=(const Shape& other) const { return dims != other.dims; }

    friend std::ostream& operator<<(std::ostream& os, const Shape& shape);

private:
    std::vector<std::size_t> dims;
};

/// Thrown when data does not fit the shape it is paired with, or when the number of elements
/// of a shape is not representable
class ShapeError : public std::runtime_error {
public:
    ShapeError(const Shape& _shape, std::size_t _n);
    ShapeError(const Shape& _shape, const std::string& message);

    Shape shape;
    std::size_t n = 0; ///< Number of values paired with the shape, if any
};

/// Row-major strides derived from a Shape: strides[i] is the product of shape[j] for all j > i.
class Strides {
public:
    Strides() = default;
    explicit Strides(const Shape& shape);

    std::size_t size() const { return values_.size(); }
    std::size_t operator[](std::size_t i) const { return values_[i]; }
    const std::vector<std::size_t>& values() const { return values_; }

    std::optional<std::size_t> flat_index(const Shape& shape,
                                          const std::vector<std::size_t>& index) const;
    Strides remove_axis(Axis axis) const;

    bool operator==(const Strides& other) const { return values_ == other.values_; }

private:
    explicit Strides(std::vector<std::size_t> _values) : values_(std::move(_values)) {}
    std::vector<std::size_t> values_;
};

#endif // SFS_SHAPE_HPP
