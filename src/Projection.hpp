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

#ifndef SFS_PROJECTION_HPP
#define SFS_PROJECTION_HPP

#include "Array.hpp"
#include "Count.hpp"
#include "Hypergeometric.hpp"
#include "Shape.hpp"

#include <stdexcept>
#include <string>
#include <vector>

class ProjectionError : public std::runtime_error {
public:
    enum class Kind {
        Zero,              ///< A target dimension is empty
        UnequalDimensions, ///< Source and target differ in number of dimensions
        InvalidProjection, ///< A target dimension is larger than its source dimension
        MismatchingShapes, ///< The output array does not have the target shape
    };

    ProjectionError(Kind _kind, const std::string& message)
        : std::runtime_error(message), kind(_kind) {}

    Kind kind;
};

/// Validate that `to` is a valid projection target for `from`, throwing ProjectionError if not
void check_projection(const Shape& from, const Shape& to);

/// Hypergeometric down-projection of whole spectrum cells from one shape to a smaller one.
/// See Marth (2004) and Gutenkunst (2009).
class Projection {
public:
    Projection(Shape _from, Shape _to);

    std::size_t dimensions() const { return from_shape.dimensions(); }
    const Shape& from() const { return from_shape; }
    const Shape& to() const { return to_shape; }

    /// Joint PMF over every cell of the target shape, in row-major order, for source cell `from`
    std::vector<double> project(const Count& from);

    /// Spread `weight` over `to` according to the projection of source cell `from`
    void project_to_weighted(const Count& from, Array& to, double weight);

private:
    Shape from_shape;
    Shape to_shape;
    JointIndependentDistribution distribution;
};

/// Site-wise projection to a fixed target shape, where the source size varies from site to site
/// with the number of called genotypes.
class PartialProjection {
public:
    explicit PartialProjection(Shape _project_to);

    const Shape& project_to() const { return to_shape; }
    /// Number of alleles in each target population
    const Count& target_alleles() const { return target; }

    /// Spread `weight` over `to` for a site with `counts` derived alleles out of `totals`
    /// called alleles. Every total must be at least the corresponding target allele count.
    void project_to_weighted(const Count& totals, const Count& counts, Array& to, double weight);

private:
    Shape to_shape;
    Count target;
    JointIndependentDistribution distribution;
};

#endif // SFS_PROJECTION_HPP
