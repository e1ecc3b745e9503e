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

#ifndef SFS_FOLD_HPP
#define SFS_FOLD_HPP

#include "Array.hpp"

/// Fold an array onto the half where the summed index is at most half the maximum summed
/// index. Each kept cell becomes the sum of itself and its mirror cell, cells on the folding
/// diagonal (if one exists) become the mean of the two, and the remaining half is set to `fill`.
Array fold(const Array& src, double fill);

#endif // SFS_FOLD_HPP
