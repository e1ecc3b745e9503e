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

#ifndef SFS_HYPERGEOMETRIC_HPP
#define SFS_HYPERGEOMETRIC_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

/// Largest n for which n! is representable as a double
constexpr std::uint64_t MAX_EXACT_FACTORIAL = 170;

/// log(n!), exact from a precomputed table up to MAX_EXACT_FACTORIAL and from the Lanczos
/// log-gamma approximation beyond
double ln_factorial(std::uint64_t n);

/// Binomial coefficient C(n, k), rounded to the nearest integer; zero if k > n
double binomial(std::uint64_t n, std::uint64_t k);

/// Probability of `observed` successes in `draws` draws without replacement from a population
/// of `size` containing `successes` successes. Assumes successes <= size.
double hypergeometric_pmf(std::uint64_t size, std::uint64_t successes, std::uint64_t draws,
                          std::uint64_t observed);

class DistributionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Hypergeometric distribution over the number of derived alleles in a sub-sample of `draws`
/// alleles, taken from `size` alleles of which `successes` are derived.
class HypergeometricDistribution {
public:
    HypergeometricDistribution(std::size_t _size, std::size_t _draws);

    void set_successes(std::size_t _successes);
    double pmf(std::size_t observed) const;

public:
    std::size_t size = 0;
    std::size_t draws = 0;
    std::size_t successes = 0;
};

/// Product of independent per-population hypergeometric distributions
class JointIndependentDistribution {
public:
    JointIndependentDistribution(std::vector<HypergeometricDistribution> _distributions);

    std::size_t dimensions() const { return distributions.size(); }
    void set_successes(const std::vector<std::size_t>& successes);
    double pmf(const std::vector<std::size_t>& observed) const;

public:
    std::vector<HypergeometricDistribution> distributions;
};

#endif // SFS_HYPERGEOMETRIC_HPP
