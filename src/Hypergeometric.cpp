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

#include "Hypergeometric.hpp"

#include <boost/math/special_functions/gamma.hpp>

#include <array>
#include <cmath>
#include <sstream>
#include <vector>

namespace {

using FactorialTable = std::array<double, MAX_EXACT_FACTORIAL + 1>;

// Initialised once on first use and read-only afterwards
const FactorialTable& factorials() {
    static const FactorialTable table = [] {
        FactorialTable t;
        t[0] = 1.0;
        double acc = 1.0;
        for (std::size_t i = 1; i < t.size(); i++) {
            acc *= static_cast<double>(i);
            t[i] = acc;
        }
        return t;
    }();
    return table;
}

} // namespace

double ln_factorial(std::uint64_t n) {
    if (n <= MAX_EXACT_FACTORIAL) {
        return std::log(factorials()[n]);
    }
    return boost::math::lgamma(static_cast<double>(n) + 1.0);
}

double binomial(std::uint64_t n, std::uint64_t k) {
    if (k > n) {
        return 0.0;
    }
    return std::floor(0.5 + std::exp(ln_factorial(n) - ln_factorial(k) - ln_factorial(n - k)));
}

double hypergeometric_pmf(std::uint64_t size, std::uint64_t successes, std::uint64_t draws,
                          std::uint64_t observed) {
    if (observed > draws) {
        return 0.0;
    }
    return binomial(successes, observed) * binomial(size - successes, draws - observed) /
           binomial(size, draws);
}

HypergeometricDistribution::HypergeometricDistribution(std::size_t _size, std::size_t _draws)
    : size(_size), draws(_draws) {
    if (draws > size) {
        std::ostringstream oss;
        oss << "Cannot draw " << draws << " from hypergeometric distribution of size " << size;
        throw DistributionError(oss.str());
    }
}

void HypergeometricDistribution::set_successes(std::size_t _successes) {
    if (_successes > size) {
        std::ostringstream oss;
        oss << "Found " << _successes << " successes in hypergeometric distribution of size "
            << size;
        throw DistributionError(oss.str());
    }
    successes = _successes;
}

double HypergeometricDistribution::pmf(std::size_t observed) const {
    return hypergeometric_pmf(size, successes, draws, observed);
}

JointIndependentDistribution::JointIndependentDistribution(
    std::vector<HypergeometricDistribution> _distributions)
    : distributions(std::move(_distributions)) {
    if (distributions.empty()) {
        throw DistributionError("Joint distribution requires at least one dimension");
    }
}

void JointIndependentDistribution::set_successes(const std::vector<std::size_t>& successes) {
    if (successes.size() != distributions.size()) {
        std::ostringstream oss;
        oss << "Expected " << distributions.size() << " success counts, found "
            << successes.size();
        throw DistributionError(oss.str());
    }
    for (std::size_t i = 0; i < successes.size(); i++) {
        distributions[i].set_successes(successes[i]);
    }
}

double JointIndependentDistribution::pmf(const std::vector<std::size_t>& observed) const {
    if (observed.size() != distributions.size()) {
        std::ostringstream oss;
        oss << "Expected " << distributions.size() << " observations, found " << observed.size();
        throw DistributionError(oss.str());
    }
    double joint = 1.0;
    for (std::size_t i = 0; i < observed.size(); i++) {
        joint *= distributions[i].pmf(observed[i]);
    }
    return joint;
}
