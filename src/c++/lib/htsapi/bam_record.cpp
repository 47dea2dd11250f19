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

#include "htsapi/bam_record.hpp"
#include "htsapi/align_path_bam_util.hpp"

#include <iostream>

void bam_record::get_read_string(std::string& read) const
{
  read.clear();
  const unsigned size(read_size());
  const uint8_t* seq(bam_get_seq(_bp));
  read.reserve(size);
  for (unsigned i(0); i < size; ++i) {
    read.push_back(seq_nt16_str[bam_seqi(seq, i)]);
  }
}

std::ostream& operator<<(std::ostream& os, const bam_record& br)
{
  if (br.empty()) {
    os << "NONE";
  } else {
    os << br.qname() << "/" << br.read_no() << " tid:pos:strand " << br.target_id() << ":" << (br.pos() - 1)
       << ":" << (br.is_fwd_strand() ? '+' : '-');

    ALIGNPATH::path_t apath;
    bam_cigar_to_apath(br.raw_cigar(), br.n_cigar(), apath);
    os << " cigar: " << apath;

    if (br.is_unmapped()) {
      os << " unmapped";
    }
    if (br.is_secondary()) {
      os << " issec";
    }
    if (br.is_supplementary()) {
      os << " issupp";
    }
  }
  return os;
}
