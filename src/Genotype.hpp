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


#ifndef SFS_GENOTYPE_HPP
#define SFS_GENOTYPE_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

/// A diploid, diallelic genotype coded as its number of derived alleles
enum class Genotype : std::uint8_t { Zero = 0, One = 1, Two = 2 };

std::optional<Genotype> genotype_from_raw(std::size_t raw);

/// Reasons for skipping a genotype without failing the read
enum class Skipped : std::uint8_t { MissingGenotype = 0, MissingAllele = 1, Multiallelic = 2 };

constexpr std::size_t NUM_SKIPPED_REASONS = 3;

const char* skipped_reason(Skipped skipped);

/// Structural genotype errors, which abort reading
enum class GenotypeError : std::uint8_t { NotDiploid = 0 };

const char* genotype_error_reason(GenotypeError error);

/// Outcome of reading the genotype of a single sample at a single site
class GenotypeResult {
public:
    enum class Kind { Genotype, Skipped, Error };

    static GenotypeResult from_genotype(Genotype genotype);
    static GenotypeResult from_skipped(Skipped skipped);
    static GenotypeResult from_error(GenotypeError error);

    Kind kind() const { return kind_; }
    /// Only meaningful for the matching kind
    Genotype genotype() const { return genotype_; }
    Skipped skipped() const { return skipped_; }
    GenotypeError error() const { return error_; }

    bool operator==(const GenotypeResult& other) const;
    bool operator!=(const GenotypeResult& other) const { return !(*this == other); }

private:
    GenotypeResult() = default;

    Kind kind_ = Kind::Genotype;
    Genotype genotype_ = Genotype::Zero;
    Skipped skipped_ = Skipped::MissingGenotype;
    GenotypeError error_ = GenotypeError::NotDiploid;
};

std::ostream& operator<<(std::ostream& os, const GenotypeResult& result);

/// Parse the GT value of a VCF sample column, e.g. "0/1", "1|1" or "./.".
/// Throws std::invalid_argument if an allele is neither "." nor a non-negative integer.
GenotypeResult parse_vcf_genotype(const std::string& gt);

#endif // SFS_GENOTYPE_HPP
