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

#include "Count.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <vector>

Count Count::from_zeros(std::size_t dimensions) {
    return Count(std::vector<std::size_t>(dimensions, 0));
}

Count Count::from_shape(const Shape& shape) {
    std::vector<std::size_t> out;
    out.reserve(shape.dimensions());
    for (std::size_t i = 0; i < shape.dimensions(); i++) {
        if (shape[i] == 0) {
            std::ostringstream oss;
            oss << "Cannot convert shape " << shape << " with empty dimension " << i << " to count";
            throw std::runtime_error(oss.str());
        }
        out.push_back(shape[i] - 1);
    }
    return Count(out);
}

Shape Count::into_shape() const {
    std::vector<std::size_t> out(values);
    for (auto& x : out) {
        x += 1;
    }
    return Shape(out);
}

void Count::set_zero() {
    std::fill(values.begin(), values.end(), 0);
}
