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

#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

std::optional<Genotype> genotype_from_raw(std::size_t raw) {
    switch (raw) {
    case 0:
        return Genotype::Zero;
    case 1:
        return Genotype::One;
    case 2:
        return Genotype::Two;
    default:
        return std::nullopt;
    }
}

const char* skipped_reason(Skipped skipped) {
    switch (skipped) {
    case Skipped::MissingGenotype:
        return "missing genotype";
    case Skipped::MissingAllele:
        return "missing genotype allele";
    case Skipped::Multiallelic:
        return "multiallelic genotype";
    }
    return "unknown";
}

const char* genotype_error_reason(GenotypeError error) {
    switch (error) {
    case GenotypeError::NotDiploid:
        return "genotype not diploid";
    }
    return "unknown";
}

GenotypeResult GenotypeResult::from_genotype(Genotype genotype) {
    GenotypeResult result;
    result.kind_ = Kind::Genotype;
    result.genotype_ = genotype;
    return result;
}

GenotypeResult GenotypeResult::from_skipped(Skipped skipped) {
    GenotypeResult result;
    result.kind_ = Kind::Skipped;
    result.skipped_ = skipped;
    return result;
}

GenotypeResult GenotypeResult::from_error(GenotypeError error) {
    GenotypeResult result;
    result.kind_ = Kind::Error;
    result.error_ = error;
    return result;
}

bool GenotypeResult::operator==(const GenotypeResult& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
    case Kind::Genotype:
        return genotype_ == other.genotype_;
    case Kind::Skipped:
        return skipped_ == other.skipped_;
    case Kind::Error:
        return error_ == other.error_;
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const GenotypeResult& result) {
    switch (result.kind()) {
    case GenotypeResult::Kind::Genotype:
        return os << "Genotype(" << static_cast<int>(result.genotype()) << ")";
    case GenotypeResult::Kind::Skipped:
        return os << "Skipped(" << skipped_reason(result.skipped()) << ")";
    case GenotypeResult::Kind::Error:
        return os << "Error(" << genotype_error_reason(result.error()) << ")";
    }
    return os;
}

GenotypeResult parse_vcf_genotype(const std::string& gt) {
    if (gt.empty() || gt == ".") {
        return GenotypeResult::from_skipped(Skipped::MissingGenotype);
    }

    boost::char_separator<char> sep("/|", "", boost::keep_empty_tokens);
    boost::tokenizer<boost::char_separator<char>> tokens(gt, sep);
    std::vector<std::string> alleles(tokens.begin(), tokens.end());
    if (alleles.size() != 2) {
        return GenotypeResult::from_error(GenotypeError::NotDiploid);
    }

    bool a_missing = alleles[0] == ".";
    bool b_missing = alleles[1] == ".";
    if (a_missing && b_missing) {
        return GenotypeResult::from_skipped(Skipped::MissingGenotype);
    }
    if (a_missing || b_missing) {
        return GenotypeResult::from_skipped(Skipped::MissingAllele);
    }

    std::size_t a = 0;
    std::size_t b = 0;
    try {
        // lexical_cast wraps negative input for unsigned targets
        if (alleles[0][0] == '-' || alleles[1][0] == '-') {
            throw boost::bad_lexical_cast();
        }
        a = boost::lexical_cast<std::size_t>(alleles[0]);
        b = boost::lexical_cast<std::size_t>(alleles[1]);
    } catch (const boost::bad_lexical_cast&) {
        std::ostringstream oss;
        oss << "Invalid genotype '" << gt << "'";
        throw std::invalid_argument(oss.str());
    }

    // Any allele other than reference or first alternative makes the site multiallelic
    if (a > 1 || b > 1) {
        return GenotypeResult::from_skipped(Skipped::Multiallelic);
    }
    return GenotypeResult::from_genotype(*genotype_from_raw(a + b));
}
