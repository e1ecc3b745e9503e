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

#include "Projection.hpp"

#include <sstream>
#include <vector>

namespace {

void check_target(const Shape& to) {
    if (to.dimensions() == 0) {
        throw ProjectionError(ProjectionError::Kind::Zero,
                              "Cannot project to a shape with no dimensions");
    }
    for (std::size_t i = 0; i < to.dimensions(); i++) {
        if (to[i] == 0) {
            std::ostringstream oss;
            oss << "Cannot project to shape " << to << " with zero in dimension " << i;
            throw ProjectionError(ProjectionError::Kind::Zero, oss.str());
        }
    }
}

JointIndependentDistribution make_distribution(const Shape& from, const Shape& to) {
    std::vector<HypergeometricDistribution> distributions;
    distributions.reserve(from.dimensions());
    for (std::size_t i = 0; i < from.dimensions(); i++) {
        distributions.emplace_back(from[i] - 1, to[i] - 1);
    }
    return JointIndependentDistribution(distributions);
}

// Add the distribution's PMF over every cell of `to`, walked in row-major order
void add_weighted(const JointIndependentDistribution& distribution, Array& to, double weight) {
    const Shape& shape = to.shape();
    bool shapes_match = shape.dimensions() == distribution.dimensions();
    for (std::size_t i = 0; shapes_match && i < shape.dimensions(); i++) {
        shapes_match = distribution.distributions[i].draws + 1 == shape[i];
    }
    if (!shapes_match) {
        std::ostringstream oss;
        oss << "Cannot add projection into spectrum with shape " << shape;
        throw ProjectionError(ProjectionError::Kind::MismatchingShapes, oss.str());
    }

    auto out = to.data().begin();
    for (const auto& index : to.iter_indices()) {
        *out += weight * distribution.pmf(index);
        ++out;
    }
}

} // namespace

void check_projection(const Shape& from, const Shape& to) {
    if (from.dimensions() != to.dimensions()) {
        std::ostringstream oss;
        oss << "Cannot project from " << from.dimensions() << " dimensions to "
            << to.dimensions() << " dimensions";
        throw ProjectionError(ProjectionError::Kind::UnequalDimensions, oss.str());
    }
    check_target(to);
    for (std::size_t i = 0; i < from.dimensions(); i++) {
        if (to[i] > from[i]) {
            std::ostringstream oss;
            oss << "Cannot project from " << from[i] << " to " << to[i] << " in dimension " << i
                << " (shape " << from << " to " << to << ")";
            throw ProjectionError(ProjectionError::Kind::InvalidProjection, oss.str());
        }
    }
}

Projection::Projection(Shape _from, Shape _to)
    : from_shape(std::move(_from)), to_shape(std::move(_to)),
      distribution((check_projection(from_shape, to_shape), make_distribution(from_shape, to_shape))) {
}

std::vector<double> Projection::project(const Count& from) {
    Array out = Array::from_zeros(to_shape);
    project_to_weighted(from, out, 1.0);
    return out.data();
}

void Projection::project_to_weighted(const Count& from, Array& to, double weight) {
    try {
        distribution.set_successes(from.values);
    } catch (const DistributionError& e) {
        throw ProjectionError(ProjectionError::Kind::InvalidProjection, e.what());
    }
    add_weighted(distribution, to, weight);
}

PartialProjection::PartialProjection(Shape _project_to)
    : to_shape(std::move(_project_to)),
      target((check_target(to_shape), Count::from_shape(to_shape))),
      distribution(make_distribution(to_shape, to_shape)) {
}

void PartialProjection::project_to_weighted(const Count& totals, const Count& counts, Array& to,
                                            double weight) {
    if (totals.dimensions() != target.dimensions() || counts.dimensions() != target.dimensions()) {
        std::ostringstream oss;
        oss << "Cannot project site with " << totals.dimensions() << " dimensions to shape "
            << to_shape;
        throw ProjectionError(ProjectionError::Kind::UnequalDimensions, oss.str());
    }
    for (std::size_t i = 0; i < target.dimensions(); i++) {
        if (totals[i] < target[i]) {
            std::ostringstream oss;
            oss << "Cannot project " << totals[i] << " called alleles to " << target[i]
                << " in dimension " << i;
            throw ProjectionError(ProjectionError::Kind::InvalidProjection, oss.str());
        }
        auto& d = distribution.distributions[i];
        d.size = totals[i];
        d.draws = target[i];
        try {
            d.set_successes(counts[i]);
        } catch (const DistributionError& e) {
            throw ProjectionError(ProjectionError::Kind::InvalidProjection, e.what());
        }
    }
    add_weighted(distribution, to, weight);
}
