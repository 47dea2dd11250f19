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

#include "htsapi/samtools_fasta_util.hpp"

#include "blt_util/blt_exception.hpp"

#include <cstdlib>

#include <sstream>

fasta_reader::fasta_reader(const std::string& ref_file) : _ref_file(ref_file), _fai(nullptr)
{
  if (_ref_file.empty()) {
    throw blt_exception("Can't initialize fasta_reader with empty filename\n");
  }

  _fai = fai_load(_ref_file.c_str());
  if (nullptr == _fai) {
    std::ostringstream oss;
    oss << "Failed to open indexed FASTA file: '" << _ref_file << "'";
    throw blt_exception(oss.str().c_str());
  }
}

fasta_reader::~fasta_reader()
{
  if (nullptr != _fai) fai_destroy(_fai);
}

bool fasta_reader::has_contig(const std::string& chrom) const
{
  return (faidx_has_seq(_fai, chrom.c_str()) != 0);
}

unsigned fasta_reader::get_contig_length(const std::string& chrom) const
{
  const int length(faidx_seq_len(_fai, chrom.c_str()));
  if (length < 0) {
    std::ostringstream oss;
    oss << "Unable to find chromosome '" << chrom << "' in reference file '" << _ref_file << "'";
    throw blt_exception(oss.str().c_str());
  }
  return static_cast<unsigned>(length);
}

void fasta_reader::get_region_seq(
    const std::string& chrom, const int begin_pos, const int end_pos, std::string& ref_seq) const
{
  ref_seq.clear();
  if (end_pos <= begin_pos) return;

  // faidx_fetch_seq takes a closed end position
  int   len(0);
  char* ref_tmp(faidx_fetch_seq(_fai, chrom.c_str(), begin_pos, end_pos - 1, &len));
  if ((nullptr == ref_tmp) || (len < 0)) {
    if (nullptr != ref_tmp) free(ref_tmp);
    std::ostringstream oss;
    oss << "Can't find sequence region '" << chrom << ":" << (begin_pos + 1) << "-" << end_pos
        << "' in reference file: '" << _ref_file << "'";
    throw blt_exception(oss.str().c_str());
  }
  ref_seq.assign(ref_tmp, len);
  free(ref_tmp);

  if (ref_seq.size() != static_cast<unsigned>(end_pos - begin_pos)) {
    std::ostringstream oss;
    oss << "Truncated sequence region '" << chrom << ":" << (begin_pos + 1) << "-" << end_pos
        << "' in reference file: '" << _ref_file << "'";
    throw blt_exception(oss.str().c_str());
  }
}
