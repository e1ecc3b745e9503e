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


#include "Genotype.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

TEST_CASE("Parse VCF genotypes") {
  SECTION("Called genotypes") {
    CHECK(parse_vcf_genotype("0/0") == GenotypeResult::from_genotype(Genotype::Zero));
    CHECK(parse_vcf_genotype("0/1") == GenotypeResult::from_genotype(Genotype::One));
    CHECK(parse_vcf_genotype("1/1") == GenotypeResult::from_genotype(Genotype::Two));
    CHECK(parse_vcf_genotype("0|1") == GenotypeResult::from_genotype(Genotype::One));
    CHECK(parse_vcf_genotype("1|0") == GenotypeResult::from_genotype(Genotype::One));
  }

  SECTION("Missing genotypes") {
    CHECK(parse_vcf_genotype("./.") == GenotypeResult::from_skipped(Skipped::MissingGenotype));
    CHECK(parse_vcf_genotype(".") == GenotypeResult::from_skipped(Skipped::MissingGenotype));
    CHECK(parse_vcf_genotype("") == GenotypeResult::from_skipped(Skipped::MissingGenotype));
    CHECK(parse_vcf_genotype("./0") == GenotypeResult::from_skipped(Skipped::MissingAllele));
    CHECK(parse_vcf_genotype("1|.") == GenotypeResult::from_skipped(Skipped::MissingAllele));
  }

  SECTION("Multiallelic genotypes") {
    CHECK(parse_vcf_genotype("1/2") == GenotypeResult::from_skipped(Skipped::Multiallelic));
    CHECK(parse_vcf_genotype("2/0") == GenotypeResult::from_skipped(Skipped::Multiallelic));
  }

  SECTION("Not diploid") {
    CHECK(parse_vcf_genotype("0") == GenotypeResult::from_error(GenotypeError::NotDiploid));
    CHECK(parse_vcf_genotype("0/0/0") == GenotypeResult::from_error(GenotypeError::NotDiploid));
  }

  SECTION("Malformed alleles") {
    CHECK_THROWS_AS(parse_vcf_genotype("a/1"), std::invalid_argument);
    CHECK_THROWS_AS(parse_vcf_genotype("-1/0"), std::invalid_argument);
    CHECK_THROWS_AS(parse_vcf_genotype("/1"), std::invalid_argument);
  }
}

TEST_CASE("Genotype reasons") {
  CHECK(std::string(skipped_reason(Skipped::MissingGenotype)) == "missing genotype");
  CHECK(std::string(skipped_reason(Skipped::MissingAllele)) == "missing genotype allele");
  CHECK(std::string(skipped_reason(Skipped::Multiallelic)) == "multiallelic genotype");
  CHECK(std::string(genotype_error_reason(GenotypeError::NotDiploid)) == "genotype not diploid");
  CHECK(genotype_from_raw(2) == Genotype::Two);
  CHECK_FALSE(genotype_from_raw(3).has_value());
}
