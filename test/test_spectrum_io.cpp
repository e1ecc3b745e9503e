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

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string le_bytes(std::uint64_t value, std::size_t n) {
  std::string out;
  for (std::size_t i = 0; i < n; i++) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
  }
  return out;
}

std::string npy_bytes(const std::string& dict, const std::string& payload, char major = 1) {
  std::string out = "\x93NUMPY";
  out.push_back(major);
  out.push_back(0);
  out += le_bytes(dict.size(), major == 1 ? 2 : 4);
  out += dict;
  out += payload;
  return out;
}

} // namespace

TEST_CASE("Format detection") {
  CHECK(detect_format("#SHAPE=<3>\n1 2 3\n") == SpectrumFormat::Text);
  CHECK(detect_format(std::string("\x93NUMPY\x01\x00", 8)) == SpectrumFormat::Npy);
  CHECK_FALSE(detect_format("1 2 3").has_value());
  CHECK_FALSE(detect_format("").has_value());

  std::istringstream input("1 2 3\n");
  CHECK_THROWS_WITH(read_scs(input), Catch::Matchers::ContainsSubstring("Unable to detect"));
}

TEST_CASE("Text format") {
  Scs scs = Scs::from_range(0, 6, Shape{2, 3});

  SECTION("Write") {
    std::ostringstream out;
    write_spectrum(out, scs);
    CHECK(out.str() == "#SHAPE=<2/3>\n0.000000 1.000000 2.000000 3.000000 4.000000 5.000000\n");
  }

  SECTION("Write with precision") {
    std::ostringstream out;
    write_spectrum(out, Scs::from_vec({0.5, 1.25}), SpectrumFormat::Text, 2);
    CHECK(out.str() == "#SHAPE=<2>\n0.50 1.25\n");
  }

  SECTION("Read") {
    std::istringstream input("#SHAPE=<2/3>\n0 1 2\t3 4 5\n");
    CHECK(read_scs(input) == scs);
  }

  SECTION("Invalid header") {
    std::istringstream input("#SHAPE=<>\n1 2\n");
    CHECK_THROWS_WITH(read_text(input),
                      Catch::Matchers::ContainsSubstring("as plain text format header"));
  }

  SECTION("Invalid value") {
    std::istringstream input("#SHAPE=<3>\n1 x 2\n");
    CHECK_THROWS_WITH(read_text(input), Catch::Matchers::ContainsSubstring("Failed to parse 'x'"));
  }

  SECTION("Shape mismatch") {
    std::istringstream input("#SHAPE=<4>\n1 2 3\n");
    CHECK_THROWS_AS(read_text(input), SpectrumFormatError);
  }
}

TEST_CASE("Npy format") {
  SECTION("Header layout") {
    std::ostringstream out;
    write_npy(out, Scs::from_vec({1.0, 2.0, 3.0}).inner());
    std::string bytes = out.str();
    std::string dict = "{'descr': '<f8', 'fortran_order': False, 'shape': (3,), }";

    REQUIRE(bytes.size() == 128 + 3 * 8);
    CHECK(bytes.substr(0, 8) == std::string("\x93NUMPY\x01\x00", 8));
    CHECK(bytes.substr(10, dict.size()) == dict);
    CHECK(bytes[127] == '\n');
  }

  SECTION("Round trip") {
    Scs scs = Scs::from_range(0, 12, Shape{2, 3, 2});
    std::stringstream buffer;
    write_spectrum(buffer, scs, SpectrumFormat::Npy);
    CHECK(buffer.str().size() % 8 == 0);
    CHECK(read_scs(buffer) == scs);
  }

  SECTION("Integer data") {
    std::string payload = le_bytes(1, 8) + le_bytes(static_cast<std::uint64_t>(-2), 8) + le_bytes(3, 8);
    std::istringstream input(
        npy_bytes("{'descr': '<i8', 'fortran_order': False, 'shape': (3,), }\n", payload));
    CHECK(read_npy(input).data() == std::vector<double>{1.0, -2.0, 3.0});
  }

  SECTION("Single precision data") {
    std::string payload = le_bytes(0x3f800000, 4) + le_bytes(0x40000000, 4);
    std::istringstream input(
        npy_bytes("{'shape': (1, 2), 'fortran_order': False, 'descr': '<f4'}\n", payload));
    Array array = read_npy(input);
    CHECK(array.shape() == Shape{1, 2});
    CHECK(array.data() == std::vector<double>{1.0, 2.0});
  }

  SECTION("Version 2 header") {
    std::string payload = le_bytes(7, 4);
    std::istringstream input(
        npy_bytes("{'descr': '<u4', 'fortran_order': False, 'shape': (1,), }\n", payload, 2));
    CHECK(read_npy(input).data() == std::vector<double>{7.0});
  }

  SECTION("Fortran order") {
    std::istringstream input(
        npy_bytes("{'descr': '<f8', 'fortran_order': True, 'shape': (1,), }\n", le_bytes(0, 8)));
    CHECK_THROWS_WITH(read_npy(input), Catch::Matchers::ContainsSubstring("Fortran order"));
  }

  SECTION("Big-endian data") {
    std::istringstream input(
        npy_bytes("{'descr': '>f8', 'fortran_order': False, 'shape': (1,), }\n", le_bytes(0, 8)));
    CHECK_THROWS_WITH(read_npy(input), Catch::Matchers::ContainsSubstring("Big-endian"));
  }

  SECTION("Truncated data") {
    std::istringstream input(
        npy_bytes("{'descr': '<f8', 'fortran_order': False, 'shape': (2,), }\n", le_bytes(0, 8)));
    CHECK_THROWS_WITH(read_npy(input), Catch::Matchers::ContainsSubstring("Unexpected end"));
  }
}

TEST_CASE("Npy format with oversized declarations") {
  SECTION("Shape with more elements than fit in memory") {
    std::istringstream input(
        npy_bytes("{'descr': '<f8', 'fortran_order': False, 'shape': (100000000000,), }\n", ""));
    CHECK_THROWS_WITH(read_npy(input), Catch::Matchers::ContainsSubstring("Unexpected end"));
  }

  SECTION("Shape whose number of elements overflows") {
    std::istringstream input(npy_bytes(
        "{'descr': '<f8', 'fortran_order': False, 'shape': (4611686018427387904, 4), }\n", ""));
    CHECK_THROWS_WITH(read_npy(input), Catch::Matchers::ContainsSubstring("overflows"));
  }

  SECTION("Shape whose byte size overflows") {
    std::istringstream input(npy_bytes(
        "{'descr': '<f8', 'fortran_order': False, 'shape': (4611686018427387904,), }\n", ""));
    CHECK_THROWS_WITH(read_npy(input), Catch::Matchers::ContainsSubstring("too large"));
  }

  SECTION("Header length beyond the limit") {
    std::string bytes = std::string("\x93NUMPY\x02\x00", 8) + le_bytes(0xffffffff, 4);
    std::istringstream input(bytes);
    CHECK_THROWS_WITH(read_npy(input), Catch::Matchers::ContainsSubstring("exceeds the maximum"));
  }
}

TEST_CASE("Spectrum files") {
  CHECK_THROWS_AS(read_scs_from_path("/nonexistent/spectrum.npy"), SpectrumFormatError);
  CHECK_THROWS_AS(write_spectrum_to_path("/nonexistent/spectrum.npy", Scs::from_vec({1.0})),
                  SpectrumFormatError);
}
