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

#ifndef SFS_SPECTRUM_HPP
#define SFS_SPECTRUM_HPP

#include "Array.hpp"
#include "Count.hpp"
#include "Fold.hpp"
#include "Projection.hpp"
#include "Shape.hpp"

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

/// State tag for a spectrum of raw site counts
struct Counts {
    static constexpr const char* name = "Scs";
};

/// State tag for a spectrum of frequencies summing to one
struct Frequencies {
    static constexpr const char* name = "Sfs";
};

class MarginalizationError : public std::runtime_error {
public:
    enum class Kind { DuplicateAxis, AxisOutOfBounds, TooManyAxes };

    MarginalizationError(Kind _kind, const std::string& message, std::size_t _axis,
                         std::size_t _dimensions)
        : std::runtime_error(message), kind(_kind), axis(_axis), dimensions(_dimensions) {}

    Kind kind;
    std::size_t axis = 0;       ///< Offending axis, or number of axes for TooManyAxes
    std::size_t dimensions = 0; ///< Dimensions of the spectrum
};

/// Sum out the given axes of an array. Throws MarginalizationError on duplicate or out of
/// bounds axes, or if no dimension would remain.
Array marginalize_array(const Array& array, const std::vector<Axis>& axes);

/// Lazy sequence of per-cell allele frequencies idx[d] / (shape[d] - 1), row-major. The range
/// holds its own copy of the shape, so it may outlive the spectrum it came from.
class FrequenciesRange {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::vector<double>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = std::vector<double>;

        Iterator(const Shape* _shape, IndicesRange::Iterator _inner) : shape(_shape), inner(_inner) {}

        std::vector<double> operator*() const {
            const auto& index = *inner;
            std::vector<double> out(index.size());
            for (std::size_t i = 0; i < index.size(); i++) {
                out[i] = static_cast<double>(index[i]) / static_cast<double>((*shape)[i] - 1);
            }
            return out;
        }
        Iterator& operator++() {
            ++inner;
            return *this;
        }
        bool operator==(const Iterator& other) const { return inner == other.inner; }
        bool operator!=(const Iterator& other) const { return inner != other.inner; }

    private:
        const Shape* shape;
        IndicesRange::Iterator inner;
    };

    explicit FrequenciesRange(Shape _shape) : indices(std::move(_shape)) {}

    Iterator begin() const { return Iterator(&indices.shape(), indices.begin()); }
    Iterator end() const { return Iterator(&indices.shape(), indices.end()); }
    std::size_t size() const { return indices.size(); }

private:
    IndicesRange indices;
};

/// A site spectrum, either of counts (Scs) or of frequencies (Sfs).
///
/// The state is a compile-time tag. A frequency spectrum can only be obtained by normalizing,
/// and operations that only make sense on raw counts are unavailable on it.
template <typename State>
class Spectrum {
    static_assert(std::is_same<State, Counts>::value || std::is_same<State, Frequencies>::value,
                  "Spectrum state must be Counts or Frequencies");

public:
    // Constructors for count spectra
    static Spectrum from_array(Array array) {
        static_assert(std::is_same<State, Counts>::value, "Only count spectra can be created directly");
        return Spectrum(std::move(array));
    }
    static Spectrum from_data(std::vector<double> data, const Shape& shape) {
        return from_array(Array(std::move(data), shape));
    }
    static Spectrum from_zeros(const Shape& shape) { return from_array(Array::from_zeros(shape)); }
    /// One-dimensional spectrum holding the given values
    static Spectrum from_vec(std::vector<double> data) {
        Shape shape{data.size()};
        return from_data(std::move(data), shape);
    }
    /// Spectrum holding start, start + 1, ..., stop - 1 in row-major order
    static Spectrum from_range(std::size_t start, std::size_t stop, const Shape& shape) {
        std::vector<double> data;
        for (std::size_t i = start; i < stop; i++) {
            data.push_back(static_cast<double>(i));
        }
        return from_data(std::move(data), shape);
    }

    std::size_t dimensions() const { return array.dimensions(); }
    std::size_t elements() const { return array.elements(); }
    const Shape& shape() const { return array.shape(); }
    const Array& inner() const { return array; }
    const std::vector<double>& data() const { return array.data(); }
    double sum() const { return array.sum(); }

    Array& inner_mut() {
        static_assert(std::is_same<State, Counts>::value, "Frequency spectra are read-only");
        return array;
    }

    const double* get(const std::vector<std::size_t>& index) const { return array.get(index); }
    const double& operator[](const std::vector<std::size_t>& index) const { return array[index]; }
    double& operator[](const std::vector<std::size_t>& index) {
        static_assert(std::is_same<State, Counts>::value, "Frequency spectra are read-only");
        return array[index];
    }

    /// Record one site with the given allele counts
    Spectrum& operator+=(const Count& count) {
        static_assert(std::is_same<State, Counts>::value, "Only count spectra accumulate sites");
        array[count.values] += 1.0;
        return *this;
    }

    FrequenciesRange iter_frequencies() const { return FrequenciesRange(array.shape()); }

    /// Folded copy, with the folded-away half set to `fill`
    Spectrum fold(double fill) const { return Spectrum(::fold(array, fill)); }

    /// Copy with the given axes summed out
    Spectrum marginalize(const std::vector<Axis>& axes) const {
        return Spectrum(marginalize_array(array, axes));
    }

    /// Copy projected down to a smaller shape by hypergeometric down-sampling of every cell.
    /// Prefer projecting site-wise while creating the spectrum where possible.
    Spectrum project(const Shape& project_to) const {
        Projection projection(array.shape(), project_to);
        Array out = Array::from_zeros(project_to);
        const auto& values = array.data();
        std::size_t i = 0;
        for (const auto& index : array.iter_indices()) {
            projection.project_to_weighted(Count(index), out, values[i]);
            i++;
        }
        return Spectrum(std::move(out));
    }

    /// Divide every cell by the total, in place. The tag is not changed; see into_normalized.
    void normalize() { array.scale(1.0 / array.sum()); }

    /// Normalized copy as a frequency spectrum
    Spectrum<Frequencies> into_normalized() const {
        Array out = array;
        out.scale(1.0 / out.sum());
        return Spectrum<Frequencies>(std::move(out));
    }

    /// Number of sites segregating in any population, i.e. all but the first and last cell
    double segregating_sites() const {
        static_assert(std::is_same<State, Counts>::value,
                      "Segregating sites are only defined for count spectra");
        const auto& values = array.data();
        double out = 0.0;
        for (std::size_t i = 1; i + 1 < values.size(); i++) {
            out += values[i];
        }
        return out;
    }

    bool operator==(const Spectrum& other) const { return array == other.array; }
    bool operator!=(const Spectrum& other) const { return array != other.array; }

    friend std::ostream& operator<<(std::ostream& os, const Spectrum& spectrum) {
        os << State::name << "(shape=" << spectrum.shape() << ", data=[";
        const auto& values = spectrum.data();
        for (std::size_t i = 0; i < values.size(); i++) {
            os << (i > 0 ? ", " : "") << values[i];
        }
        return os << "])";
    }

private:
    template <typename> friend class Spectrum;
    explicit Spectrum(Array _array) : array(std::move(_array)) {}

    Array array;
};

/// Site count spectrum
using Scs = Spectrum<Counts>;
/// Site frequency spectrum
using Sfs = Spectrum<Frequencies>;

#endif // SFS_SPECTRUM_HPP
