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


#ifndef SFS_STATISTICS_HPP
#define SFS_STATISTICS_HPP

#include "Array.hpp"
#include "Shape.hpp"
#include "Spectrum.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

/// A statistic was requested from a spectrum of the wrong dimensionality or shape
class StatisticError : public std::runtime_error {
public:
    explicit StatisticError(const std::string& message) : std::runtime_error(message) {}
};

/// Sum of the first n - 1 terms of the harmonic series
double harmonic(std::uint64_t n);
/// Sum of the first n - 1 terms of the p-harmonic series
double p_harmonic(std::uint64_t n, unsigned int p);

// Estimators of theta over one-dimensional spectra. On counts these are per region, on
// frequencies per site. n is the number of spectrum elements.
double theta_tajima(const Array& spectrum);
double theta_watterson(const Array& spectrum);
double theta_fu_li(const Array& spectrum);

// Relatedness statistics over 3x3 spectra of two individuals, see Waples et al. (2019)
double king(const Array& spectrum);
double r0(const Array& spectrum);
double r1(const Array& spectrum);

/// Average number of pairwise differences, i.e. Tajima's estimator of theta
template <typename State>
double pi(const Spectrum<State>& spectrum) {
    return theta_tajima(spectrum.inner());
}

template <typename State>
double theta_watterson(const Spectrum<State>& spectrum) {
    return theta_watterson(spectrum.inner());
}

template <typename State>
double king(const Spectrum<State>& spectrum) {
    return king(spectrum.inner());
}

template <typename State>
double r0(const Spectrum<State>& spectrum) {
    return r0(spectrum.inner());
}

template <typename State>
double r1(const Spectrum<State>& spectrum) {
    return r1(spectrum.inner());
}

/// Tajima's D, see Tajima (1989)
double tajima_d(const Scs& scs);
/// Fu and Li's D, see Fu and Li (1993)
double fu_li_d(const Scs& scs);

/// f2(A, B), see Peter (2016)
double f2(const Sfs& sfs);
/// f3(A; B, C)
double f3(const Sfs& sfs);
/// f4(A, B; C, D)
double f4(const Sfs& sfs);
/// Hudson's Fst as a ratio of averages, see Bhatia et al. (2013)
double fst(const Sfs& sfs);
/// Proportion of heterozygous sites in a single diploid individual
double heterozygosity(const Sfs& sfs);

#endif // SFS_STATISTICS_HPP
