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

#ifndef SFS_ARRAY_HPP
#define SFS_ARRAY_HPP

#include "Shape.hpp"
#include "View.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

class Array;

/// Lazy, restartable sequence of every valid multi-index of a shape in row-major order
class IndicesRange {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::vector<std::size_t>;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::vector<std::size_t>*;
        using reference = const std::vector<std::size_t>&;

        Iterator(const Shape* _shape, std::size_t _position);

        reference operator*() const { return index; }
        pointer operator->() const { return &index; }
        Iterator& operator++();
        Iterator operator++(int);
        bool operator==(const Iterator& other) const { return position == other.position; }
        bool operator!=(const Iterator& other) const { return position != other.position; }

    private:
        const Shape* shape;
        std::vector<std::size_t> index;
        std::size_t position = 0;
    };

    explicit IndicesRange(Shape _shape) : shape_(std::move(_shape)) {}

    // Iterators point into the range, which must outlive them
    Iterator begin() const { return Iterator(&shape_, 0); }
    Iterator end() const { return Iterator(&shape_, shape_.elements()); }
    std::size_t size() const { return shape_.elements(); }
    const Shape& shape() const { return shape_; }

private:
    Shape shape_;
};

/// Lazy sequence of the Views along one axis of an Array. Like View, the range borrows the
/// Array and must not be used past its mutation or destruction, so iterate over a named
/// array rather than a temporary.
class AxisRange {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = View;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = View;

        Iterator(const Array* _array, Axis _axis, std::size_t _position)
            : array(_array), axis(_axis), position(_position) {}

        View operator*() const;
        Iterator& operator++() {
            position++;
            return *this;
        }
        bool operator==(const Iterator& other) const { return position == other.position; }
        bool operator!=(const Iterator& other) const { return position != other.position; }

    private:
        const Array* array;
        Axis axis;
        std::size_t position = 0;
    };

    AxisRange(const Array& _array, Axis _axis);

    Iterator begin() const { return Iterator(array, axis, 0); }
    Iterator end() const { return Iterator(array, axis, length); }
    std::size_t size() const { return length; }

private:
    const Array* array;
    Axis axis;
    std::size_t length = 0;
};

/// An N-dimensional strided array of doubles in row-major order.
class Array {
public:
    /// Throws ShapeError if the number of values does not match the shape
    Array(std::vector<double> _data, Shape _shape);

    static Array from_element(double element, const Shape& shape);
    static Array from_zeros(const Shape& shape);

    std::size_t dimensions() const { return shape_.dimensions(); }
    std::size_t elements() const { return data_.size(); }
    const Shape& shape() const { return shape_; }
    const Strides& strides() const { return strides_; }

    // Flat row-major storage
    const std::vector<double>& data() const { return data_; }
    std::vector<double>& data() { return data_; }
    std::vector<double>::const_iterator begin() const { return data_.begin(); }
    std::vector<double>::const_iterator end() const { return data_.end(); }
    std::vector<double>::iterator begin() { return data_.begin(); }
    std::vector<double>::iterator end() { return data_.end(); }

    /// Element at a multi-index, or nullptr if the index has the wrong number of dimensions or
    /// any component is out of bounds
    const double* get(const std::vector<std::size_t>& index) const;
    double* get(const std::vector<std::size_t>& index);

    /// As get, but throws std::out_of_range on an invalid index
    const double& operator[](const std::vector<std::size_t>& index) const;
    double& operator[](const std::vector<std::size_t>& index);

    /// View with `axis` fixed at `index`, or nothing if either is out of bounds
    std::optional<View> get_axis(Axis axis, std::size_t index) const;
    /// As get_axis, but throws std::out_of_range
    View index_axis(Axis axis, std::size_t index) const;

    /// Reduce one axis by addition
    Array sum(Axis axis) const;
    /// Sum of all elements
    double sum() const;
    void scale(double factor);

    IndicesRange iter_indices() const { return IndicesRange(shape_); }
    AxisRange iter_axis(Axis axis) const { return AxisRange(*this, axis); }

    bool operator==(const Array& other) const;
    bool operator!=(const Array& other) const { return !(*this == other); }

private:
    std::vector<double> data_;
    Shape shape_;
    Strides strides_;
};

#endif // SFS_ARRAY_HPP
