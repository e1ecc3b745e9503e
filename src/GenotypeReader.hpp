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


#ifndef SFS_GENOTYPE_READER_HPP
#define SFS_GENOTYPE_READER_HPP

#include "Genotype.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

/// Outcome of pulling the next record from a reader
enum class ReadStatus { Read, Done, Error };

/// Fatal I/O or format error while reading genotypes
class GenotypeReaderError : public std::runtime_error {
public:
    explicit GenotypeReaderError(const std::string& message) : std::runtime_error(message) {}
};

/// Source of per-sample genotypes, one site at a time
class GenotypeReader {
public:
    virtual ~GenotypeReader() = default;

    /// Contig of the most recently read site
    virtual const std::string& current_contig() const = 0;
    /// Position of the most recently read site within its contig
    virtual std::size_t current_position() const = 0;

    /// Read the genotypes of the next site into `genotypes`, one entry per sample in the order of
    /// samples(). On ReadStatus::Error, error() describes the failure.
    virtual ReadStatus read_genotypes(std::vector<GenotypeResult>& genotypes) = 0;

    virtual const std::vector<std::string>& samples() const = 0;

    /// Description of the last error
    const std::string& error() const { return error_message; }

protected:
    std::string error_message;
};

#endif // SFS_GENOTYPE_READER_HPP
