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


#include "Hypergeometric.hpp"
#include "test_utils.hpp"

#include <boost/math/distributions/hypergeometric.hpp>
#include <boost/math/special_functions/gamma.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Log factorial") {
  CHECK(ln_factorial(0) == 0.0);
  CHECK(ln_factorial(1) == 0.0);
  CHECK_THAT(ln_factorial(5), WithinRel(std::log(120.0), 1e-12));

  SECTION("Agrees with log-gamma on both sides of the exact table") {
    for (std::uint64_t n : {10u, 100u, 170u, 171u, 500u, 10000u}) {
      CHECK_THAT(ln_factorial(n), WithinRel(boost::math::lgamma(static_cast<double>(n) + 1.0), 1e-10));
    }
  }
}

TEST_CASE("Binomial coefficients") {
  CHECK(binomial(6, 2) == 15.0);
  CHECK(binomial(10, 0) == 1.0);
  CHECK(binomial(10, 10) == 1.0);
  CHECK(binomial(2, 3) == 0.0);
  CHECK(binomial(300, 2) == 44850.0);
}

TEST_CASE("Hypergeometric PMF") {
  SECTION("Reference values") {
    std::vector<double> pmf;
    for (std::uint64_t k : {4u, 5u, 6u, 7u, 8u}) {
      pmf.push_back(hypergeometric_pmf(10, 7, 8, k));
    }
    check_all_close(pmf, {0.0, 0.466667, 0.466667, 0.066667, 0.0});

    check_all_close({hypergeometric_pmf(6, 2, 2, 0), hypergeometric_pmf(6, 2, 2, 1), hypergeometric_pmf(6, 2, 2, 2)},
                    {0.4, 0.533333, 0.066667});
  }

  SECTION("Agrees with boost distribution") {
    for (unsigned size : {5u, 12u, 40u}) {
      for (unsigned successes = 0; successes <= size; successes += 3) {
        for (unsigned draws = 0; draws <= size; draws += 4) {
          boost::math::hypergeometric_distribution<double> reference(successes, draws, size);
          unsigned lo = successes + draws > size ? successes + draws - size : 0;
          unsigned hi = std::min(successes, draws);
          for (unsigned k = lo; k <= hi; k++) {
            CHECK_THAT(hypergeometric_pmf(size, successes, draws, k),
                       WithinAbs(boost::math::pdf(reference, k), 1e-9));
          }
        }
      }
    }
  }

  SECTION("Observations beyond draws have zero probability") {
    CHECK(hypergeometric_pmf(10, 5, 3, 4) == 0.0);
  }
}

TEST_CASE("Hypergeometric distribution validation") {
  CHECK_THROWS_AS(HypergeometricDistribution(4, 5), DistributionError);

  HypergeometricDistribution distribution(6, 2);
  CHECK_THROWS_WITH(distribution.set_successes(7),
                    Catch::Matchers::ContainsSubstring("Found 7 successes"));
  distribution.set_successes(2);
  CHECK_THAT(distribution.pmf(0), WithinAbs(0.4, 1e-6));
}

TEST_CASE("Joint independent distribution") {
  CHECK_THROWS_AS(JointIndependentDistribution({}), DistributionError);

  JointIndependentDistribution joint({HypergeometricDistribution(2, 1), HypergeometricDistribution(2, 1)});
  joint.set_successes({1, 2});
  CHECK_THAT(joint.pmf({0, 1}), WithinAbs(0.5, 1e-12));
  CHECK_THAT(joint.pmf({1, 1}), WithinAbs(0.5, 1e-12));
  CHECK_THAT(joint.pmf({1, 0}), WithinAbs(0.0, 1e-12));
  CHECK_THROWS_AS(joint.set_successes({1}), DistributionError);
  CHECK_THROWS_AS(joint.pmf({0, 0, 0}), DistributionError);
}
