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

#include "Array.hpp"

#include <Eigen/Core>

#include <sstream>
#include <stdexcept>
#include <vector>

using Eigen::ArrayXd;

Array::Array(std::vector<double> _data, Shape _shape)
    : data_(std::move(_data)), shape_(std::move(_shape)) {
    if (data_.size() != shape_.elements()) {
        throw ShapeError(shape_, data_.size());
    }
    strides_ = shape_.strides();
}

Array Array::from_element(double element, const Shape& shape) {
    return Array(std::vector<double>(shape.elements(), element), shape);
}

Array Array::from_zeros(const Shape& shape) {
    return from_element(0.0, shape);
}

const double* Array::get(const std::vector<std::size_t>& index) const {
    auto flat = strides_.flat_index(shape_, index);
    if (!flat) {
        return nullptr;
    }
    return &data_[*flat];
}

double* Array::get(const std::vector<std::size_t>& index) {
    auto flat = strides_.flat_index(shape_, index);
    if (!flat) {
        return nullptr;
    }
    return &data_[*flat];
}

const double& Array::operator[](const std::vector<std::size_t>& index) const {
    const double* value = get(index);
    if (value == nullptr) {
        throw std::out_of_range("Index has invalid dimension or is out of bounds");
    }
    return *value;
}

double& Array::operator[](const std::vector<std::size_t>& index) {
    double* value = get(index);
    if (value == nullptr) {
        throw std::out_of_range("Index has invalid dimension or is out of bounds");
    }
    return *value;
}

std::optional<View> Array::get_axis(Axis axis, std::size_t index) const {
    if (axis >= dimensions() || index >= shape_[axis]) {
        return std::nullopt;
    }
    std::size_t offset = index * strides_[axis];
    return View(data_.data() + offset, shape_.remove_axis(axis), strides_.remove_axis(axis));
}

View Array::index_axis(Axis axis, std::size_t index) const {
    auto view = get_axis(axis, index);
    if (!view) {
        std::ostringstream oss;
        oss << "Axis " << axis << " or index " << index << " out of bounds for shape " << shape_;
        throw std::out_of_range(oss.str());
    }
    return *view;
}

Array Array::sum(Axis axis) const {
    if (axis >= dimensions()) {
        std::ostringstream oss;
        oss << "Cannot sum over axis " << axis << " of array with " << dimensions()
            << " dimensions";
        throw std::out_of_range(oss.str());
    }
    Array out = Array::from_zeros(shape_.remove_axis(axis));
    for (const View& view : iter_axis(axis)) {
        auto it = out.data_.begin();
        for (double x : view) {
            *it += x;
            ++it;
        }
    }
    return out;
}

double Array::sum() const {
    return Eigen::Map<const ArrayXd>(data_.data(), static_cast<Eigen::Index>(data_.size())).sum();
}

void Array::scale(double factor) {
    Eigen::Map<ArrayXd>(data_.data(), static_cast<Eigen::Index>(data_.size())) *= factor;
}

bool Array::operator==(const Array& other) const {
    return shape_ == other.shape_ && data_ == other.data_;
}

IndicesRange::Iterator::Iterator(const Shape* _shape, std::size_t _position)
    : shape(_shape), index(_shape->dimensions(), 0), position(_position) {
    if (position > 0 && position < shape->elements()) {
        index = shape->index_from_flat(position);
    }
}

IndicesRange::Iterator& IndicesRange::Iterator::operator++() {
    position++;
    for (std::size_t axis = index.size(); axis-- > 0;) {
        index[axis]++;
        if (index[axis] < (*shape)[axis]) {
            break;
        }
        index[axis] = 0;
    }
    return *this;
}

IndicesRange::Iterator IndicesRange::Iterator::operator++(int) {
    Iterator tmp = *this;
    ++(*this);
    return tmp;
}

AxisRange::AxisRange(const Array& _array, Axis _axis) : array(&_array), axis(_axis) {
    if (axis >= array->dimensions()) {
        std::ostringstream oss;
        oss << "Cannot iterate over axis " << axis << " of array with " << array->dimensions()
            << " dimensions";
        throw std::out_of_range(oss.str());
    }
    length = array->shape()[axis];
}

View AxisRange::Iterator::operator*() const {
    return array->index_axis(axis, position);
}
