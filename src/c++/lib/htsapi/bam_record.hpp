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

#include "htsapi/bam_util.hpp"

#include <iosfwd>
#include <string>

/// owns one htslib alignment record
struct bam_record {
  bam_record() : _bp(bam_init1()) {}

  ~bam_record() { bam_destroy1(_bp); }

  bam_record(const bam_record& br) : _bp(bam_dup1(br._bp)) {}

  bam_record& operator=(const bam_record& br)
  {
    if (this == &br) return (*this);
    bam_copy1(_bp, br._bp);
    return (*this);
  }

  const char* qname() const { return bam_get_qname(_bp); }

  bool is_unmapped() const { return ((_bp->core.flag & BAM_FLAG::UNMAPPED) != 0); }
  bool is_fwd_strand() const { return (!((_bp->core.flag & BAM_FLAG::STRAND) != 0)); }
  bool is_first() const { return ((_bp->core.flag & BAM_FLAG::FIRST_READ) != 0); }
  bool is_second() const { return ((_bp->core.flag & BAM_FLAG::SECOND_READ) != 0); }
  bool is_secondary() const { return ((_bp->core.flag & BAM_FLAG::SECONDARY) != 0); }
  bool is_supplementary() const { return ((_bp->core.flag & BAM_FLAG::SUPPLEMENTARY) != 0); }

  int read_no() const { return ((is_second() && (!is_first())) ? 2 : 1); }

  int target_id() const { return _bp->core.tid; }

  /// one-indexed position
  int pos() const { return (_bp->core.pos + 1); }

  const uint32_t* raw_cigar() const { return bam_get_cigar(_bp); }
  unsigned        n_cigar() const { return _bp->core.n_cigar; }

  unsigned read_size() const { return _bp->core.l_qseq; }

  /// decode the read sequence from the 4-bit encoding into a string of IUPAC symbols
  ///
  /// records which do not store the read sequence ('*' in SAM) produce an empty string
  void get_read_string(std::string& read) const;

  bam1_t* get_data() { return _bp; }

  const bam1_t* get_data() const { return _bp; }

  bool empty() const { return (_bp->l_data == 0); }

private:
  friend struct bam_streamer;

  bam1_t* _bp;
};

/// Generate summary bam_record output for developer debugging
std::ostream& operator<<(std::ostream& os, const bam_record& br);
