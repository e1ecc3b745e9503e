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


#ifndef SFS_VCF_READER_HPP
#define SFS_VCF_READER_HPP

#include "GenotypeReader.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <vector>

/// Genotype reader for uncompressed VCF text.
///
/// The header is consumed on construction; a missing or malformed #CHROM line throws
/// GenotypeReaderError.
class VcfReader : public GenotypeReader {
public:
    explicit VcfReader(std::istream& _input);
    /// Reader owning its input file. Throws GenotypeReaderError if the file cannot be opened.
    static std::unique_ptr<VcfReader> from_path(const std::string& path);

    const std::string& current_contig() const override { return contig; }
    std::size_t current_position() const override { return position; }
    ReadStatus read_genotypes(std::vector<GenotypeResult>& genotypes) override;
    const std::vector<std::string>& samples() const override { return sample_names; }

private:
    explicit VcfReader(std::unique_ptr<std::istream> _owned);

    void read_header();
    ReadStatus fail(const std::string& message);

    std::unique_ptr<std::istream> owned;
    std::istream& input;
    std::vector<std::string> sample_names;
    std::string line;
    std::string contig;
    std::size_t position = 0;
    std::size_t line_number = 0;
};

#endif // SFS_VCF_READER_HPP
