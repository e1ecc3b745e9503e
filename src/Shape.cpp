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

#include "Shape.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

std::string shape_error_message(const Shape& shape, std::size_t n) {
    std::ostringstream oss;
    oss << "Cannot construct array with shape " << shape << " from " << n << " elements";
    return oss.str();
}

} // namespace

ShapeError::ShapeError(const Shape& _shape, std::size_t _n)
    : std::runtime_error(shape_error_message(_shape, _n)), shape(_shape), n(_n) {
}

ShapeError::ShapeError(const Shape& _shape, const std::string& message)
    : std::runtime_error(message), shape(_shape) {
}

Shape::Shape(std::vector<std::size_t> _dims) : dims(std::move(_dims)) {
}

Shape Shape::from_individuals(const std::vector<std::size_t>& individuals) {
    std::vector<std::size_t> out;
    out.reserve(individuals.size());
    for (auto i : individuals) {
        out.push_back(2 * i + 1);
    }
    return Shape(out);
}

std::size_t Shape::elements() const {
    if (std::find(dims.begin(), dims.end(), 0) != dims.end()) {
        return 0;
    }
    std::size_t n = 1;
    for (auto d : dims) {
        if (n > std::numeric_limits<std::size_t>::max() / d) {
            std::ostringstream oss;
            oss << "Number of elements in shape " << *this << " overflows";
            throw ShapeError(*this, oss.str());
        }
        n *= d;
    }
    return n;
}

Strides Shape::strides() const {
    return Strides(*this);
}

std::optional<std::size_t> Shape::flat_index(const std::vector<std::size_t>& index) const {
    return strides().flat_index(*this, index);
}

std::vector<std::size_t> Shape::index_from_flat(std::size_t flat) const {
    std::size_t n = elements();
    std::vector<std::size_t> index(dims.size(), 0);
    for (std::size_t i = 0; i < dims.size(); i++) {
        n /= dims[i];
        index[i] = flat / n;
        flat %= n;
    }
    return index;
}

std::size_t Shape::index_sum_from_flat(std::size_t flat) const {
    std::size_t n = elements();
    std::size_t sum = 0;
    for (auto d : dims) {
        n /= d;
        sum += flat / n;
        flat %= n;
    }
    return sum;
}

Shape Shape::remove_axis(Axis axis) const {
    if (axis >= dims.size()) {
        std::ostringstream oss;
        oss << "Cannot remove axis " << axis << " from shape with " << dims.size() << " dimensions";
        throw std::out_of_range(oss.str());
    }
    std::vector<std::size_t> out(dims);
    out.erase(out.begin() + axis);
    return Shape(out);
}

std::string Shape::to_string() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Shape& shape) {
    for (std::size_t i = 0; i < shape.dims.size(); i++) {
        if (i > 0) {
            os << "/";
        }
        os << shape.dims[i];
    }
    return os;
}

Strides::Strides(const Shape& shape) : values_(shape.dimensions(), 1) {
    // Walk from the innermost axis outwards, accumulating the extent seen so far
    std::size_t acc = 1;
    for (std::size_t i = shape.dimensions(); i-- > 0;) {
        values_[i] = acc;
        acc *= shape[i];
    }
}

std::optional<std::size_t> Strides::flat_index(const Shape& shape,
                                               const std::vector<std::size_t>& index) const {
    if (index.size() != shape.dimensions() || index.size() != values_.size()) {
        return std::nullopt;
    }
    std::size_t flat = 0;
    for (std::size_t i = 0; i < index.size(); i++) {
        if (index[i] >= shape[i]) {
            return std::nullopt;
        }
        flat += index[i] * values_[i];
    }
    return flat;
}

Strides Strides::remove_axis(Axis axis) const {
    if (axis >= values_.size()) {
        std::ostringstream oss;
        oss << "Cannot remove axis " << axis << " from strides with " << values_.size()
            << " dimensions";
        throw std::out_of_range(oss.str());
    }
    std::vector<std::size_t> out(values_);
    out.erase(out.begin() + axis);
    return Strides(out);
}
