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


#include "SampleMap.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <sstream>
#include <string>
#include <vector>

TEST_CASE("Sample map from all samples") {
  SampleMap map = SampleMap::from_all({"a", "b", "c"});
  CHECK(map.size() == 3);
  CHECK(map.number_of_populations() == 1);
  CHECK(map.populations()[0].to_string() == "[unnamed]");
  CHECK(map.shape() == Shape{7});
  CHECK(map.get_population_id("b") == 0);
  CHECK_FALSE(map.get_population_id("d").has_value());
}

TEST_CASE("Sample map from pairs") {
  SampleMap map = SampleMap::from_pairs({{"s0", "pop1"}, {"s1", "pop0"}, {"s2", "pop1"}, {"s3", "pop1"}});

  SECTION("Population ids follow first appearance") {
    CHECK(map.number_of_populations() == 2);
    CHECK(map.get_population_id("s0") == 0);
    CHECK(map.get_population_id("s1") == 1);
    CHECK(map.populations()[0].to_string() == "pop1");
    CHECK(map.population_sizes() == std::vector<std::size_t>{3, 1});
    CHECK(map.shape() == Shape{7, 3});
    CHECK(map.shape().dimensions() == map.number_of_populations());
  }

  SECTION("Samples keep insertion order") {
    CHECK(map.samples() == std::vector<std::string>{"s0", "s1", "s2", "s3"});
    CHECK(map.get_sample_id("s2") == 2);
    CHECK(*map.get_sample(3) == "s3");
    CHECK(map.get_sample(4) == nullptr);
  }

  SECTION("Duplicate samples are rejected") {
    CHECK_THROWS_WITH(map.insert("s1", Population("pop0")),
                      Catch::Matchers::ContainsSubstring("defined more than once"));
  }
}

TEST_CASE("Sample map from samples file") {
  SECTION("With populations") {
    std::istringstream input("sample0\tA\nsample1\tB\r\n\nsample2\tA\n");
    SampleMap map = SampleMap::from_stream(input);
    CHECK(map.size() == 3);
    CHECK(map.number_of_populations() == 2);
    CHECK(map.populations()[1].to_string() == "B");
    CHECK(map.shape() == Shape{5, 3});
  }

  SECTION("Without populations") {
    std::istringstream input("sample0\nsample1\n");
    SampleMap map = SampleMap::from_stream(input);
    CHECK(map.number_of_populations() == 1);
    CHECK_FALSE(map.populations()[0].is_named());
    CHECK(map.shape() == Shape{5});
  }

  SECTION("Missing file") {
    CHECK_THROWS_AS(SampleMap::from_path("/nonexistent/samples.txt"), SampleMapError);
  }

  SECTION("Empty input") {
    std::istringstream input("");
    CHECK(SampleMap::from_stream(input).empty());
  }
}
