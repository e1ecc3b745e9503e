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


#ifndef SFS_SPECTRUM_IO_HPP
#define SFS_SPECTRUM_IO_HPP

#include "Array.hpp"
#include "Spectrum.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

class SpectrumFormatError : public std::runtime_error {
public:
    explicit SpectrumFormatError(const std::string& message) : std::runtime_error(message) {}
};

enum class SpectrumFormat {
    Text, ///< "#SHAPE=<a/b/c>" header line followed by one line of space-separated values
    Npy,  ///< numpy .npy
};

constexpr std::size_t DEFAULT_PRECISION = 6;

/// Format of serialized data judged from its leading bytes, or nothing if unrecognized
std::optional<SpectrumFormat> detect_format(const std::string& leading);

void write_text(std::ostream& out, const Array& array, std::size_t precision = DEFAULT_PRECISION);
Array read_text(std::istream& in);

/// Writes npy version 1.0 with dtype '<f8' in C order
void write_npy(std::ostream& out, const Array& array);
/// Reads npy versions 1.0 to 3.0 with little-endian 4- or 8-byte float, signed or unsigned
/// integer data in C order
Array read_npy(std::istream& in);

/// Read a count spectrum, detecting the format unless one is given
Scs read_scs(std::istream& in, std::optional<SpectrumFormat> format = std::nullopt);
Scs read_scs_from_path(const std::string& path, std::optional<SpectrumFormat> format = std::nullopt);

/// Precision only applies to the text format
template <typename State>
void write_spectrum(std::ostream& out, const Spectrum<State>& spectrum,
                    SpectrumFormat format = SpectrumFormat::Text,
                    std::size_t precision = DEFAULT_PRECISION) {
    if (format == SpectrumFormat::Npy) {
        write_npy(out, spectrum.inner());
    } else {
        write_text(out, spectrum.inner(), precision);
    }
    if (!out) {
        throw SpectrumFormatError("Failed to write spectrum");
    }
}

void write_array_to_path(const std::string& path, const Array& array, SpectrumFormat format,
                         std::size_t precision);

/// Overwrites any existing file
template <typename State>
void write_spectrum_to_path(const std::string& path, const Spectrum<State>& spectrum,
                            SpectrumFormat format = SpectrumFormat::Text,
                            std::size_t precision = DEFAULT_PRECISION) {
    write_array_to_path(path, spectrum.inner(), format, precision);
}

#endif // SFS_SPECTRUM_IO_HPP
