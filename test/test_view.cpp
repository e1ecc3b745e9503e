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


#include "Array.hpp"
#include "View.hpp"

#include <catch2/catch_test_macros.hpp>

#include <numeric>
#include <vector>

namespace {

Array range_array(const Shape& shape) {
  std::vector<double> data(shape.elements());
  std::iota(data.begin(), data.end(), 0.0);
  return Array(data, shape);
}

std::vector<double> collect(const View& view) {
  return std::vector<double>(view.begin(), view.end());
}

} // namespace

TEST_CASE("View along axis of 2D array") {
  Array array = range_array(Shape{2, 3});

  CHECK(collect(array.index_axis(0, 0)) == std::vector<double>{0., 1., 2.});
  CHECK(collect(array.index_axis(0, 1)) == std::vector<double>{3., 4., 5.});
  CHECK(collect(array.index_axis(1, 0)) == std::vector<double>{0., 3.});
  CHECK(collect(array.index_axis(1, 2)) == std::vector<double>{2., 5.});
}

TEST_CASE("View along axis of 3D array") {
  Array array = range_array(Shape{2, 3, 2});

  SECTION("Axis 0") {
    CHECK(collect(array.index_axis(0, 0)) == std::vector<double>{0., 1., 2., 3., 4., 5.});
    CHECK(collect(array.index_axis(0, 1)) == std::vector<double>{6., 7., 8., 9., 10., 11.});
  }

  SECTION("Axis 1") {
    CHECK(collect(array.index_axis(1, 0)) == std::vector<double>{0., 1., 6., 7.});
    CHECK(collect(array.index_axis(1, 1)) == std::vector<double>{2., 3., 8., 9.});
    CHECK(collect(array.index_axis(1, 2)) == std::vector<double>{4., 5., 10., 11.});
  }

  SECTION("Axis 2") {
    CHECK(collect(array.index_axis(2, 0)) == std::vector<double>{0., 2., 4., 6., 8., 10.});
    CHECK(collect(array.index_axis(2, 1)) == std::vector<double>{1., 3., 5., 7., 9., 11.});
  }

  SECTION("Shapes and strides") {
    View view = array.index_axis(1, 1);
    CHECK(view.shape() == Shape{2, 2});
    CHECK(view.strides().values() == std::vector<std::size_t>{6, 1});
    CHECK(view.elements() == 4);
  }
}

TEST_CASE("View element access") {
  Array array = range_array(Shape{2, 3, 2});
  View view = array.index_axis(1, 2);
  CHECK(*view.get({0, 0}) == 4.);
  CHECK(*view.get({1, 1}) == 11.);
  CHECK(view.get({2, 0}) == nullptr);
  CHECK(view.get({0}) == nullptr);
  CHECK(view.to_array() == Array({4., 5., 10., 11.}, Shape{2, 2}));
}

TEST_CASE("Invalid axis views") {
  Array array = range_array(Shape{2, 3});
  CHECK_FALSE(array.get_axis(2, 0).has_value());
  CHECK_FALSE(array.get_axis(0, 2).has_value());
  CHECK(array.get_axis(1, 2).has_value());
  CHECK_THROWS_AS(array.index_axis(0, 5), std::out_of_range);
  CHECK_THROWS_AS(array.iter_axis(3), std::out_of_range);
}

TEST_CASE("Iterate over axis") {
  Array array = range_array(Shape{2, 3});
  std::vector<std::vector<double>> views;
  for (const View& view : array.iter_axis(1)) {
    views.push_back(collect(view));
  }
  std::vector<std::vector<double>> expected{{0., 3.}, {1., 4.}, {2., 5.}};
  CHECK(views == expected);
}
