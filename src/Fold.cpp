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

#include "Fold.hpp"

#include <vector>

Array fold(const Array& src, double fill) {
    const Shape& shape = src.shape();
    const std::vector<double>& in = src.data();
    std::size_t n = in.size();

    std::size_t total_count = 0;
    for (auto d : shape) {
        total_count += d - 1;
    }
    std::size_t mid_count = total_count / 2;

    // With an even total there is a hyperplane of cells exactly on the midpoint, e.g. the
    // middle cell of a 1D spectrum with five elements, or the anti-diagonal of a 3x3 spectrum.
    // Those cells are their own mirror image.
    bool has_diagonal = total_count % 2 == 0;

    // The mirror of flat position i is n - 1 - i, so folding in place would read cells that
    // were already overwritten.
    Array out = Array::from_zeros(shape);
    std::vector<double>& dst = out.data();

    for (std::size_t i = 0; i < n; i++) {
        std::size_t rev_i = n - 1 - i;
        std::size_t count = shape.index_sum_from_flat(i);

        if (count < mid_count || (count == mid_count && !has_diagonal)) {
            dst[i] = in[i] + in[rev_i];
        } else if (count == mid_count) {
            // Same convention as dadi
            dst[i] = 0.5 * in[i] + 0.5 * in[rev_i];
        } else {
            dst[i] = fill;
        }
    }
    return out;
}
