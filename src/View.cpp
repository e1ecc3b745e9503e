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

#include "View.hpp"
#include "Array.hpp"

#include <vector>

View::View(const double* _data, Shape _shape, Strides _strides)
    : data(_data), shape_(std::move(_shape)), strides_(std::move(_strides)) {
}

const double* View::get(const std::vector<std::size_t>& index) const {
    auto flat = strides_.flat_index(shape_, index);
    if (!flat) {
        return nullptr;
    }
    return data + *flat;
}

Array View::to_array() const {
    std::vector<double> values;
    values.reserve(elements());
    for (double x : *this) {
        values.push_back(x);
    }
    return Array(values, shape_);
}

View::Iterator::Iterator(const View* _view, std::size_t _position)
    : view(_view), coords(_view->dimensions(), 0), offset(0), position(_position) {
}

View::Iterator& View::Iterator::operator++() {
    position++;
    // Increment the innermost axis, carrying outwards on overflow. Each carry rewinds the
    // offset by the full extent of the axis that wrapped.
    for (std::size_t axis = coords.size(); axis-- > 0;) {
        coords[axis]++;
        if (coords[axis] < view->shape_[axis]) {
            offset += view->strides_[axis];
            return *this;
        }
        coords[axis] = 0;
        offset -= view->strides_[axis] * (view->shape_[axis] - 1);
    }
    return *this;
}

View::Iterator View::Iterator::operator++(int) {
    Iterator tmp = *this;
    ++(*this);
    return tmp;
}
