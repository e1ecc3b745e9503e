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


#include "VcfReader.hpp"

#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>

#include <fstream>
#include <sstream>

namespace {

// Fixed columns before the first sample
constexpr std::size_t NUM_FIXED_COLUMNS = 9;
constexpr std::size_t FORMAT_COLUMN = 8;

std::vector<std::string> split(const std::string& s, const char* delimiters) {
    boost::char_separator<char> sep(delimiters, "", boost::keep_empty_tokens);
    boost::tokenizer<boost::char_separator<char>> tokens(s, sep);
    return std::vector<std::string>(tokens.begin(), tokens.end());
}

void strip_carriage_return(std::string& s) {
    if (!s.empty() && s.back() == '\r') {
        s.pop_back();
    }
}

} // namespace

VcfReader::VcfReader(std::istream& _input) : input(_input) {
    read_header();
}

VcfReader::VcfReader(std::unique_ptr<std::istream> _owned) : owned(std::move(_owned)), input(*owned) {
    read_header();
}

std::unique_ptr<VcfReader> VcfReader::from_path(const std::string& path) {
    auto file = std::make_unique<std::ifstream>(path);
    if (!*file) {
        std::ostringstream oss;
        oss << "Unable to open VCF file " << path;
        throw GenotypeReaderError(oss.str());
    }
    return std::unique_ptr<VcfReader>(new VcfReader(std::move(file)));
}

void VcfReader::read_header() {
    while (std::getline(input, line)) {
        line_number++;
        strip_carriage_return(line);
        if (line.rfind("##", 0) == 0) {
            continue;
        }
        if (line.rfind("#CHROM", 0) != 0) {
            break;
        }
        std::vector<std::string> columns = split(line, "\t");
        if (columns.size() < NUM_FIXED_COLUMNS - 1) {
            std::ostringstream oss;
            oss << "Malformed VCF header line: expected at least " << NUM_FIXED_COLUMNS - 1
                << " columns, found " << columns.size();
            throw GenotypeReaderError(oss.str());
        }
        for (std::size_t i = NUM_FIXED_COLUMNS; i < columns.size(); i++) {
            sample_names.push_back(columns[i]);
        }
        return;
    }
    throw GenotypeReaderError("VCF input has no #CHROM header line");
}

ReadStatus VcfReader::fail(const std::string& message) {
    std::ostringstream oss;
    oss << "Invalid VCF record on line " << line_number << ": " << message;
    error_message = oss.str();
    return ReadStatus::Error;
}

ReadStatus VcfReader::read_genotypes(std::vector<GenotypeResult>& genotypes) {
    do {
        if (!std::getline(input, line)) {
            if (input.bad()) {
                error_message = "I/O error while reading VCF input";
                return ReadStatus::Error;
            }
            return ReadStatus::Done;
        }
        line_number++;
        strip_carriage_return(line);
    } while (line.empty());

    std::vector<std::string> columns = split(line, "\t");
    if (columns.size() != NUM_FIXED_COLUMNS + sample_names.size()) {
        std::ostringstream oss;
        oss << "expected " << NUM_FIXED_COLUMNS + sample_names.size() << " columns, found "
            << columns.size();
        return fail(oss.str());
    }

    contig = columns[0];
    try {
        position = boost::lexical_cast<std::size_t>(columns[1]);
    } catch (const boost::bad_lexical_cast&) {
        return fail("invalid position '" + columns[1] + "'");
    }

    // GT is conventionally first but may be anywhere in FORMAT
    std::vector<std::string> format = split(columns[FORMAT_COLUMN], ":");
    std::size_t gt_index = format.size();
    for (std::size_t i = 0; i < format.size(); i++) {
        if (format[i] == "GT") {
            gt_index = i;
            break;
        }
    }

    genotypes.clear();
    genotypes.reserve(sample_names.size());
    for (std::size_t i = NUM_FIXED_COLUMNS; i < columns.size(); i++) {
        std::vector<std::string> fields = split(columns[i], ":");
        if (gt_index >= fields.size()) {
            genotypes.push_back(GenotypeResult::from_skipped(Skipped::MissingGenotype));
            continue;
        }
        try {
            genotypes.push_back(parse_vcf_genotype(fields[gt_index]));
        } catch (const std::invalid_argument& e) {
            return fail(e.what());
        }
    }
    return ReadStatus::Read;
}
