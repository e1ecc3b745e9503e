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


#include "SpectrumIO.hpp"

#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <vector>

namespace {

const std::string NPY_MAGIC = "\x93NUMPY";
const std::string TEXT_START = "#SHAPE";

// Magic, version and a two-byte header length
constexpr std::size_t NPY_V1_PREAMBLE = 10;
constexpr std::size_t NPY_ALIGNMENT = 64;
constexpr std::size_t NPY_MAX_HEADER_LENGTH = 1 << 20;
constexpr std::size_t READ_CHUNK = 1 << 16;

std::uint64_t read_le(const unsigned char* bytes, std::size_t n) {
    std::uint64_t out = 0;
    for (std::size_t i = 0; i < n; i++) {
        out |= static_cast<std::uint64_t>(bytes[i]) << (8 * i);
    }
    return out;
}

void write_le(std::ostream& out, std::uint64_t value, std::size_t n) {
    for (std::size_t i = 0; i < n; i++) {
        out.put(static_cast<char>((value >> (8 * i)) & 0xff));
    }
}

// Grows the buffer one chunk at a time, so a length declared by a truncated file is never
// allocated up front
std::string read_exact(std::istream& in, std::size_t n, const char* what) {
    std::string buffer;
    while (buffer.size() < n) {
        std::size_t offset = buffer.size();
        std::size_t chunk = std::min(READ_CHUNK, n - offset);
        buffer.resize(offset + chunk);
        if (!in.read(&buffer[offset], static_cast<std::streamsize>(chunk))) {
            std::ostringstream oss;
            oss << "Unexpected end of npy data while reading " << what;
            throw SpectrumFormatError(oss.str());
        }
    }
    return buffer;
}

// Value following `'key':` in a npy header dict, up to the next top-level comma or closing brace
std::string dict_value(const std::string& dict, const std::string& key) {
    std::string quoted = "'" + key + "'";
    std::size_t start = dict.find(quoted);
    if (start == std::string::npos) {
        std::ostringstream oss;
        oss << "npy header is missing key " << quoted;
        throw SpectrumFormatError(oss.str());
    }
    start = dict.find(':', start + quoted.size());
    if (start == std::string::npos) {
        throw SpectrumFormatError("Malformed npy header dict");
    }
    start++;
    while (start < dict.size() && std::isspace(static_cast<unsigned char>(dict[start]))) {
        start++;
    }
    std::size_t stop = start;
    if (stop < dict.size() && dict[stop] == '(') {
        stop = dict.find(')', stop);
        if (stop == std::string::npos) {
            throw SpectrumFormatError("Malformed npy shape");
        }
        return dict.substr(start, stop - start + 1);
    }
    while (stop < dict.size() && dict[stop] != ',' && dict[stop] != '}') {
        stop++;
    }
    std::string value = dict.substr(start, stop - start);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    if (value.size() >= 2 && (value.front() == '\'' || value.front() == '"')) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

Shape parse_npy_shape(const std::string& tuple) {
    std::vector<std::size_t> dims;
    boost::char_separator<char> sep("(), ");
    boost::tokenizer<boost::char_separator<char>> tokens(tuple, sep);
    try {
        for (const auto& token : tokens) {
            dims.push_back(boost::lexical_cast<std::size_t>(token));
        }
    } catch (const boost::bad_lexical_cast&) {
        std::ostringstream oss;
        oss << "Invalid npy shape " << tuple;
        throw SpectrumFormatError(oss.str());
    }
    return Shape(dims);
}

double decode_value(const unsigned char* bytes, char kind, std::size_t size) {
    std::uint64_t raw = read_le(bytes, size);
    if (kind == 'f' && size == 8) {
        double value;
        std::memcpy(&value, &raw, sizeof(value));
        return value;
    }
    if (kind == 'f') {
        auto raw32 = static_cast<std::uint32_t>(raw);
        float value;
        std::memcpy(&value, &raw32, sizeof(value));
        return static_cast<double>(value);
    }
    if (kind == 'i' && size == 8) {
        std::int64_t value;
        std::memcpy(&value, &raw, sizeof(value));
        return static_cast<double>(value);
    }
    if (kind == 'i') {
        auto raw32 = static_cast<std::uint32_t>(raw);
        std::int32_t value;
        std::memcpy(&value, &raw32, sizeof(value));
        return static_cast<double>(value);
    }
    return static_cast<double>(raw);
}

Array make_array(std::vector<double> values, const Shape& shape) {
    try {
        return Array(std::move(values), shape);
    } catch (const ShapeError& e) {
        throw SpectrumFormatError(e.what());
    }
}

} // namespace

std::optional<SpectrumFormat> detect_format(const std::string& leading) {
    if (leading.compare(0, NPY_MAGIC.size(), NPY_MAGIC) == 0) {
        return SpectrumFormat::Npy;
    }
    if (leading.compare(0, TEXT_START.size(), TEXT_START) == 0) {
        return SpectrumFormat::Text;
    }
    return std::nullopt;
}

void write_text(std::ostream& out, const Array& array, std::size_t precision) {
    out << "#SHAPE=<" << array.shape().to_string() << ">\n";
    std::ios_base::fmtflags flags = out.flags();
    std::streamsize old_precision = out.precision();
    out << std::fixed << std::setprecision(static_cast<int>(precision));
    bool first = true;
    for (double value : array) {
        if (!first) {
            out << " ";
        }
        out << value;
        first = false;
    }
    out << "\n";
    out.flags(flags);
    out.precision(old_precision);
}

Array read_text(std::istream& in) {
    std::string header;
    if (!std::getline(in, header)) {
        throw SpectrumFormatError("Missing text spectrum header");
    }

    // Only the digits and separators between the first and last digit make up the shape
    std::size_t first = header.find_first_of("0123456789");
    std::size_t last = header.find_last_of("0123456789");
    if (first == std::string::npos) {
        std::ostringstream oss;
        oss << "Failed to parse '" << header << "' as plain text format header";
        throw SpectrumFormatError(oss.str());
    }
    std::string dims_str = header.substr(first, last - first + 1);

    std::vector<std::size_t> dims;
    boost::char_separator<char> sep("/", "", boost::keep_empty_tokens);
    boost::tokenizer<boost::char_separator<char>> tokens(dims_str, sep);
    try {
        for (const auto& token : tokens) {
            dims.push_back(boost::lexical_cast<std::size_t>(token));
        }
    } catch (const boost::bad_lexical_cast&) {
        std::ostringstream oss;
        oss << "Failed to parse '" << header << "' as plain text format header";
        throw SpectrumFormatError(oss.str());
    }

    std::vector<double> values;
    std::string token;
    while (in >> token) {
        try {
            values.push_back(boost::lexical_cast<double>(token));
        } catch (const boost::bad_lexical_cast&) {
            std::ostringstream oss;
            oss << "Failed to parse '" << token << "' as spectrum value";
            throw SpectrumFormatError(oss.str());
        }
    }
    return make_array(std::move(values), Shape(dims));
}

void write_npy(std::ostream& out, const Array& array) {
    std::ostringstream dict;
    dict << "{'descr': '<f8', 'fortran_order': False, 'shape': (";
    const Shape& shape = array.shape();
    for (std::size_t i = 0; i < shape.dimensions(); i++) {
        dict << (i > 0 ? ", " : "") << shape[i];
    }
    if (shape.dimensions() == 1) {
        dict << ",";
    }
    dict << "), }";

    std::string header = dict.str();
    std::size_t unpadded = NPY_V1_PREAMBLE + header.size() + 1;
    header.append((NPY_ALIGNMENT - unpadded % NPY_ALIGNMENT) % NPY_ALIGNMENT, ' ');
    header.push_back('\n');

    out.write(NPY_MAGIC.data(), static_cast<std::streamsize>(NPY_MAGIC.size()));
    out.put(1);
    out.put(0);
    write_le(out, header.size(), 2);
    out.write(header.data(), static_cast<std::streamsize>(header.size()));

    for (double value : array) {
        std::uint64_t raw;
        std::memcpy(&raw, &value, sizeof(raw));
        write_le(out, raw, 8);
    }
}

Array read_npy(std::istream& in) {
    std::string magic = read_exact(in, NPY_MAGIC.size(), "magic");
    if (magic != NPY_MAGIC) {
        throw SpectrumFormatError("Invalid npy magic");
    }

    std::string version = read_exact(in, 2, "version");
    auto major = static_cast<unsigned char>(version[0]);
    std::size_t length_bytes = 0;
    if (major == 1) {
        length_bytes = 2;
    } else if (major == 2 || major == 3) {
        length_bytes = 4;
    } else {
        std::ostringstream oss;
        oss << "Unsupported npy version " << static_cast<int>(major) << "."
            << static_cast<int>(static_cast<unsigned char>(version[1]));
        throw SpectrumFormatError(oss.str());
    }
    std::string length = read_exact(in, length_bytes, "header length");
    std::size_t header_length = static_cast<std::size_t>(
        read_le(reinterpret_cast<const unsigned char*>(length.data()), length_bytes));
    if (header_length > NPY_MAX_HEADER_LENGTH) {
        std::ostringstream oss;
        oss << "npy header length " << header_length << " exceeds the maximum of "
            << NPY_MAX_HEADER_LENGTH;
        throw SpectrumFormatError(oss.str());
    }
    std::string dict = read_exact(in, header_length, "header");

    if (dict_value(dict, "fortran_order") != "False") {
        throw SpectrumFormatError("Fortran order not supported when reading npy");
    }

    std::string descr = dict_value(dict, "descr");
    if (descr.size() != 3) {
        std::ostringstream oss;
        oss << "Unsupported npy type descriptor '" << descr << "'";
        throw SpectrumFormatError(oss.str());
    }
    if (descr[0] == '>') {
        throw SpectrumFormatError("Big-endian npy data not supported");
    }
    char kind = descr[1];
    std::size_t size = static_cast<std::size_t>(descr[2] - '0');
    bool supported = descr[0] == '<' && (kind == 'f' || kind == 'i' || kind == 'u') &&
                     (size == 4 || size == 8);
    if (!supported) {
        std::ostringstream oss;
        oss << "Unsupported npy type descriptor '" << descr << "'";
        throw SpectrumFormatError(oss.str());
    }

    Shape shape = parse_npy_shape(dict_value(dict, "shape"));
    std::size_t elements = 0;
    try {
        elements = shape.elements();
    } catch (const ShapeError& e) {
        throw SpectrumFormatError(e.what());
    }
    if (elements > std::numeric_limits<std::size_t>::max() / size) {
        std::ostringstream oss;
        oss << "npy shape " << shape << " is too large";
        throw SpectrumFormatError(oss.str());
    }
    std::string payload = read_exact(in, elements * size, "data");

    std::vector<double> values(elements);
    const auto* bytes = reinterpret_cast<const unsigned char*>(payload.data());
    for (std::size_t i = 0; i < elements; i++) {
        values[i] = decode_value(bytes + i * size, kind, size);
    }
    return make_array(std::move(values), shape);
}

Scs read_scs(std::istream& in, std::optional<SpectrumFormat> format) {
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!format) {
        format = detect_format(raw);
    }
    if (!format) {
        throw SpectrumFormatError("Unable to detect spectrum format");
    }

    std::istringstream buffer(raw);
    if (*format == SpectrumFormat::Npy) {
        return Scs::from_array(read_npy(buffer));
    }
    return Scs::from_array(read_text(buffer));
}

Scs read_scs_from_path(const std::string& path, std::optional<SpectrumFormat> format) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::ostringstream oss;
        oss << "Unable to open spectrum file " << path;
        throw SpectrumFormatError(oss.str());
    }
    return read_scs(file, format);
}

void write_array_to_path(const std::string& path, const Array& array, SpectrumFormat format,
                         std::size_t precision) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        std::ostringstream oss;
        oss << "Unable to open " << path << " for writing";
        throw SpectrumFormatError(oss.str());
    }
    if (format == SpectrumFormat::Npy) {
        write_npy(file, array);
    } else {
        write_text(file, array, precision);
    }
    if (!file) {
        std::ostringstream oss;
        oss << "Failed to write spectrum to " << path;
        throw SpectrumFormatError(oss.str());
    }
}
