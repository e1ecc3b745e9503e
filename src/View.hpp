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

#ifndef SFS_VIEW_HPP
#define SFS_VIEW_HPP

#include "Shape.hpp"

#include <cstddef>
#include <iterator>
#include <vector>

class Array;

/// A read-only window into an Array with one axis fixed at a given index.
///
/// A View borrows the buffer of the Array it was taken from and copies nothing. It must not be
/// kept after that Array is mutated, moved or destroyed.
class View {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = double;
        using difference_type = std::ptrdiff_t;
        using pointer = const double*;
        using reference = const double&;

        Iterator(const View* _view, std::size_t _position);

        reference operator*() const { return view->data[offset]; }
        Iterator& operator++();
        Iterator operator++(int);
        bool operator==(const Iterator& other) const { return position == other.position; }
        bool operator!=(const Iterator& other) const { return position != other.position; }

    private:
        const View* view;
        std::vector<std::size_t> coords;
        std::size_t offset = 0;
        std::size_t position = 0;
    };

    View(const double* _data, Shape _shape, Strides _strides);

    std::size_t dimensions() const { return shape_.dimensions(); }
    std::size_t elements() const { return shape_.elements(); }
    const Shape& shape() const { return shape_; }
    const Strides& strides() const { return strides_; }

    /// Element at a multi-index into the view, or nullptr if out of bounds
    const double* get(const std::vector<std::size_t>& index) const;

    // Row-major over the view's own axes
    Iterator begin() const { return Iterator(this, 0); }
    Iterator end() const { return Iterator(this, elements()); }

    /// Owned copy of the viewed elements
    Array to_array() const;

private:
    const double* data; // first element of the view
    Shape shape_;
    Strides strides_;
};

#endif // SFS_VIEW_HPP
