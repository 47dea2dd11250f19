//
// Pileup - Genomic Read Pileup Track
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
///

#pragma once

#include "boost/utility.hpp"

#include <string>

extern "C" {
#include "htslib/faidx.h"
}

/// Random access to an indexed FASTA file
///
/// The index ('.fai') is created by htslib if it is missing and the FASTA directory is writable.
struct fasta_reader : public boost::noncopyable {
  /// \throws blt_exception if the file can't be opened or indexed
  explicit fasta_reader(const std::string& ref_file);

  ~fasta_reader();

  const std::string& name() const { return _ref_file; }

  bool has_contig(const std::string& chrom) const;

  /// \return length of chrom
  ///
  /// \throws blt_exception if chrom is not in the index
  unsigned get_contig_length(const std::string& chrom) const;

  /// Get the sequence of chrom in [begin_pos,end_pos), with zero-indexed positions
  ///
  /// The range must be inside of the contig.
  ///
  /// \throws blt_exception if the sequence can't be read
  void get_region_seq(const std::string& chrom, const int begin_pos, const int end_pos, std::string& ref_seq) const;

private:
  std::string _ref_file;
  faidx_t*    _fai;
};
