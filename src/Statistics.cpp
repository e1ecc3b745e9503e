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


#include "Statistics.hpp"

#include "Hypergeometric.hpp"

#include <cmath>
#include <sstream>

namespace {

void check_dimensions(const Shape& shape, std::size_t expected) {
    if (shape.dimensions() != expected) {
        std::ostringstream oss;
        oss << "expected spectrum with dimension " << expected << ", found spectrum with dimension "
            << shape.dimensions();
        throw StatisticError(oss.str());
    }
}

void check_shape(const Shape& shape, const Shape& expected) {
    if (shape != expected) {
        std::ostringstream oss;
        oss << "expected spectrum with shape " << expected << ", found spectrum with shape "
            << shape;
        throw StatisticError(oss.str());
    }
}

// Sum of weight(i) * spectrum[i] over all cells but the first
template <typename Weight>
double weighted_theta(const Array& spectrum, Weight weight) {
    check_dimensions(spectrum.shape(), 1);
    const auto& values = spectrum.data();
    double out = 0.0;
    for (std::size_t i = 1; i < values.size(); i++) {
        out += weight(i) * values[i];
    }
    return out;
}

double tajima_variance(std::size_t n, double s) {
    // Notation from Tajima (1989), see also Durrett (2008) pp. 65-66
    double nf = static_cast<double>(n);
    double a1 = harmonic(n);
    double a2 = p_harmonic(n, 2);

    double b1 = (nf + 1.0) / (3.0 * (nf - 1.0));
    double b2 = 2.0 * (nf * nf + nf + 3.0) / (9.0 * nf * (nf - 1.0));

    double c1 = b1 - 1.0 / a1;
    double c2 = b2 - (nf + 2.0) / (a1 * nf) + a2 / (a1 * a1);

    double e1 = c1 / a1;
    double e2 = c2 / (a1 * a1 + a2);

    return std::sqrt(e1 * s + e2 * s * (s - 1.0));
}

double fu_li_variance(std::size_t n, double s) {
    // Notation from Fu and Li (1993), see also Durrett (2008) p. 67. The numerator uses thetas
    // rather than counts, hence the extra factor 1 / a.
    double nf = static_cast<double>(n);
    double a = harmonic(n);
    double g = p_harmonic(n, 2);

    double c = (2.0 * nf * a - 4.0 * (nf - 1.0)) / ((nf - 1.0) * (nf - 2.0));
    double v = 1.0 + a * a / (g + a * a) * (c - (nf + 1.0) / (nf - 1.0));
    double u = a - 1.0 - v;

    return std::sqrt(u * s + v * s * s) / a;
}

} // namespace

double harmonic(std::uint64_t n) {
    return p_harmonic(n, 1);
}

double p_harmonic(std::uint64_t n, unsigned int p) {
    double out = 0.0;
    for (std::uint64_t i = 1; i < n; i++) {
        out += 1.0 / std::pow(static_cast<double>(i), static_cast<double>(p));
    }
    return out;
}

double theta_tajima(const Array& spectrum) {
    std::size_t n = spectrum.elements();
    double pairs = binomial(n, 2);
    return weighted_theta(spectrum, [n, pairs](std::size_t i) {
        return static_cast<double>(i * (n - i)) / pairs;
    });
}

double theta_watterson(const Array& spectrum) {
    double a = harmonic(spectrum.elements());
    return weighted_theta(spectrum, [a](std::size_t) { return 1.0 / a; });
}

double theta_fu_li(const Array& spectrum) {
    check_dimensions(spectrum.shape(), 1);
    if (spectrum.elements() < 2) {
        throw StatisticError("expected spectrum with at least two elements");
    }
    return spectrum.data()[1];
}

double king(const Array& spectrum) {
    check_shape(spectrum.shape(), Shape{3, 3});
    const Array& s = spectrum;
    double numerator = s[{1, 1}] - 2.0 * (s[{0, 2}] + s[{2, 0}]);
    double denominator = s[{0, 1}] + s[{1, 0}] + 2.0 * s[{1, 1}] + s[{1, 2}] + s[{2, 1}];
    return numerator / denominator;
}

double r0(const Array& spectrum) {
    check_shape(spectrum.shape(), Shape{3, 3});
    const Array& s = spectrum;
    return (s[{0, 2}] + s[{2, 0}]) / s[{1, 1}];
}

double r1(const Array& spectrum) {
    check_shape(spectrum.shape(), Shape{3, 3});
    const Array& s = spectrum;
    double denominator = s[{0, 1}] + s[{0, 2}] + s[{1, 0}] + s[{1, 2}] + s[{2, 0}] + s[{2, 1}];
    return s[{1, 1}] / denominator;
}

double tajima_d(const Scs& scs) {
    check_dimensions(scs.shape(), 1);
    double variance = tajima_variance(scs.elements(), scs.segregating_sites());
    return (theta_tajima(scs.inner()) - theta_watterson(scs.inner())) / variance;
}

double fu_li_d(const Scs& scs) {
    check_dimensions(scs.shape(), 1);
    double variance = fu_li_variance(scs.elements(), scs.segregating_sites());
    return (theta_watterson(scs.inner()) - theta_fu_li(scs.inner())) / variance;
}

double f2(const Sfs& sfs) {
    check_dimensions(sfs.shape(), 2);
    const auto& values = sfs.data();
    double out = 0.0;
    std::size_t i = 0;
    for (const auto& f : sfs.iter_frequencies()) {
        out += values[i] * (f[0] - f[1]) * (f[0] - f[1]);
        i++;
    }
    return out;
}

double f3(const Sfs& sfs) {
    check_dimensions(sfs.shape(), 3);
    const auto& values = sfs.data();
    double out = 0.0;
    std::size_t i = 0;
    for (const auto& f : sfs.iter_frequencies()) {
        out += values[i] * (f[0] - f[1]) * (f[0] - f[2]);
        i++;
    }
    return out;
}

double f4(const Sfs& sfs) {
    check_dimensions(sfs.shape(), 4);
    const auto& values = sfs.data();
    double out = 0.0;
    std::size_t i = 0;
    for (const auto& f : sfs.iter_frequencies()) {
        out += values[i] * (f[0] - f[1]) * (f[2] - f[3]);
        i++;
    }
    return out;
}

double fst(const Sfs& sfs) {
    check_dimensions(sfs.shape(), 2);
    const Shape& shape = sfs.shape();
    double n_i_sub = static_cast<double>(shape[0]) - 2.0;
    double n_j_sub = static_cast<double>(shape[1]) - 2.0;

    const auto& values = sfs.data();
    double numerator = 0.0;
    double denominator = 0.0;
    std::size_t i = 0;
    for (const auto& f : sfs.iter_frequencies()) {
        // Only polymorphic cells contribute; drop the first and last
        if (i > 0 && i + 1 < values.size()) {
            double f_i = f[0];
            double f_j = f[1];
            double g_i = 1.0 - f_i;
            double g_j = 1.0 - f_j;
            numerator += values[i] * ((f_i - f_j) * (f_i - f_j) - f_i * g_i / n_i_sub -
                                      f_j * g_j / n_j_sub);
            denominator += values[i] * (f_i * g_j + f_j * g_i);
        }
        i++;
    }
    return numerator / denominator;
}

double heterozygosity(const Sfs& sfs) {
    check_shape(sfs.shape(), Shape{3});
    return sfs.data()[1];
}
