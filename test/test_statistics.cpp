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

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <utility>
#include <vector>

namespace {

// Aquadro and Greenberg (1983), in Durrett (2008) p. 44
Scs scs_aquadro() {
  return Scs::from_vec({0, 34, 6, 4, 0, 0, 0});
}

// Hamblin and Aquadro (1996), in Durrett (2008) p. 68, without multiallelic sites
Scs scs_hamblin() {
  return Scs::from_vec({0, 1, 11, 4, 7, 2, 0, 0, 0, 0, 0});
}

Scs scs_hamblin_mod() {
  Scs scs = scs_hamblin();
  scs[{8}] += 1.0;
  scs[{3}] += 1.0;
  return scs;
}

// Ward et al. (1991), as counted in Durrett (2008) p. 40
Scs scs_ward() {
  const std::vector<std::pair<std::size_t, double>> counts = {
      {1, 6}, {2, 2}, {3, 3}, {4, 1}, {6, 4}, {7, 1}, {10, 1},
      {12, 2}, {13, 1}, {23, 1}, {24, 1}, {25, 1}, {28, 2},
  };
  Scs scs = Scs::from_zeros(Shape{63});
  for (const auto& pair : counts) {
    scs[{pair.first}] = pair.second;
  }
  scs[{0}] = 360.0 - scs.sum();
  return scs;
}

} // namespace

TEST_CASE("Harmonic numbers") {
  CHECK(harmonic(1) == 0.0);
  CHECK_THAT(harmonic(4), Catch::Matchers::WithinAbs(1.0 + 1.0 / 2.0 + 1.0 / 3.0, 1e-12));
  CHECK_THAT(p_harmonic(4, 2), Catch::Matchers::WithinAbs(1.0 + 1.0 / 4.0 + 1.0 / 9.0, 1e-12));
}

TEST_CASE("Theta estimators") {
  SECTION("Aquadro") {
    CHECK_THAT(theta_watterson(scs_aquadro()), Catch::Matchers::WithinAbs(17.959184, 1e-6));
    CHECK_THAT(pi(scs_aquadro()), Catch::Matchers::WithinAbs(14.857143, 1e-6));
  }

  SECTION("Ward") {
    CHECK_THAT(theta_watterson(scs_ward()), Catch::Matchers::WithinAbs(5.517367, 1e-6));
    CHECK_THAT(pi(scs_ward()), Catch::Matchers::WithinAbs(5.285202, 1e-6));
  }

  SECTION("Fu and Li") {
    CHECK(theta_fu_li(scs_hamblin().inner()) == 1.0);
  }

  SECTION("Per site on frequencies") {
    Sfs sfs = scs_aquadro().into_normalized();
    CHECK_THAT(pi(sfs), Catch::Matchers::WithinAbs(14.857143 / 44.0, 1e-6));
  }

  SECTION("Wrong dimensions") {
    Scs scs = Scs::from_zeros(Shape{3, 3});
    CHECK_THROWS_WITH(theta_watterson(scs),
                      Catch::Matchers::ContainsSubstring(
                          "expected spectrum with dimension 1, found spectrum with dimension 2"));
    CHECK_THROWS_AS(pi(scs), StatisticError);
  }
}

TEST_CASE("Neutrality tests") {
  CHECK_THAT(tajima_d(scs_aquadro()), Catch::Matchers::WithinAbs(-0.995875, 1e-6));
  CHECK_THAT(tajima_d(scs_hamblin()), Catch::Matchers::WithinAbs(0.885737, 1e-6));
  CHECK_THAT(fu_li_d(scs_hamblin_mod()), Catch::Matchers::WithinAbs(1.693537, 1e-6));
  CHECK_THROWS_AS(tajima_d(Scs::from_zeros(Shape{3, 3})), StatisticError);
}

TEST_CASE("Relatedness statistics") {
  Scs scs = Scs::from_range(0, 9, Shape{3, 3});
  CHECK_THAT(king(scs), Catch::Matchers::WithinAbs(-0.5, 1e-12));
  CHECK_THAT(r0(scs), Catch::Matchers::WithinAbs(2.0, 1e-12));
  CHECK_THAT(r1(scs), Catch::Matchers::WithinAbs(1.0 / 6.0, 1e-12));

  Scs wrong = Scs::from_zeros(Shape{5, 3});
  CHECK_THROWS_WITH(king(wrong), Catch::Matchers::ContainsSubstring(
                                     "expected spectrum with shape 3/3, found spectrum with shape 5/3"));
}

TEST_CASE("F-statistics") {
  SECTION("f2 and Fst") {
    Sfs sfs = Scs::from_range(0, 9, Shape{3, 3}).into_normalized();
    CHECK_THAT(f2(sfs), Catch::Matchers::WithinAbs(1.0 / 3.0, 1e-12));
    CHECK_THAT(fst(sfs), Catch::Matchers::WithinAbs(1.0 / 3.0, 1e-12));
  }

  SECTION("f3") {
    Sfs sfs = Scs::from_range(0, 27, Shape{3, 3, 3}).into_normalized();
    CHECK_THAT(f3(sfs), Catch::Matchers::WithinAbs(1.0 / 6.0, 1e-12));
    CHECK_THROWS_AS(f2(sfs), StatisticError);
  }

  SECTION("f4") {
    Scs scs = Scs::from_zeros(Shape{3, 3, 3, 3});
    scs[{2, 0, 2, 0}] = 1.0;
    scs[{0, 2, 2, 0}] = 3.0;
    CHECK_THAT(f4(scs.into_normalized()), Catch::Matchers::WithinAbs(-0.5, 1e-12));
  }

  SECTION("Wrong dimensions") {
    Sfs sfs = Scs::from_vec({1, 2, 1}).into_normalized();
    CHECK_THROWS_AS(f2(sfs), StatisticError);
    CHECK_THROWS_AS(f3(sfs), StatisticError);
    CHECK_THROWS_AS(f4(sfs), StatisticError);
    CHECK_THROWS_AS(fst(sfs), StatisticError);
  }
}

TEST_CASE("Heterozygosity") {
  Sfs sfs = Scs::from_vec({1, 2, 1}).into_normalized();
  CHECK_THAT(heterozygosity(sfs), Catch::Matchers::WithinAbs(0.5, 1e-12));
  CHECK_THROWS_AS(heterozygosity(Scs::from_vec({1, 2, 1, 0, 0}).into_normalized()), StatisticError);
}
