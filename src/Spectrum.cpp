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


#include "Spectrum.hpp"

#include <boost/container/flat_set.hpp>

#include <sstream>

Array marginalize_array(const Array& array, const std::vector<Axis>& axes) {
    const std::size_t dimensions = array.dimensions();

    // flat_set keeps the axes sorted and unique, so removing them in order only requires
    // shifting each by the number of axes already removed
    boost::container::flat_set<Axis> sorted;
    for (Axis axis : axes) {
        if (!sorted.insert(axis).second) {
            std::ostringstream oss;
            oss << "cannot marginalize with duplicate axis " << axis;
            throw MarginalizationError(MarginalizationError::Kind::DuplicateAxis, oss.str(), axis,
                                       dimensions);
        }
    }
    for (Axis axis : sorted) {
        if (axis >= dimensions) {
            std::ostringstream oss;
            oss << "cannot marginalize axis " << axis << " in spectrum with " << dimensions
                << " dimensions";
            throw MarginalizationError(MarginalizationError::Kind::AxisOutOfBounds, oss.str(), axis,
                                       dimensions);
        }
    }
    if (sorted.size() >= dimensions) {
        std::ostringstream oss;
        oss << "cannot marginalize " << sorted.size() << " axes in spectrum with " << dimensions
            << " dimensions";
        throw MarginalizationError(MarginalizationError::Kind::TooManyAxes, oss.str(),
                                   sorted.size(), dimensions);
    }

    Array out = array;
    std::size_t removed = 0;
    for (Axis axis : sorted) {
        out = out.sum(axis - removed);
        removed++;
    }
    return out;
}
