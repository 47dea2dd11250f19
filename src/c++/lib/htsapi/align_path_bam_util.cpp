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

#include "htsapi/align_path_bam_util.hpp"

using namespace ALIGNPATH;

void bam_cigar_to_apath(const uint32_t* bam_cigar, const unsigned n_cigar, path_t& apath)
{
  // htslib operation codes follow the order of the CIGAR codes "MIDNSHP=X", offset by one from align_t
  apath.resize(n_cigar);
  for (unsigned i(0); i < n_cigar; ++i) {
    apath[i].length = (bam_cigar[i] >> BAM_CIGAR_SHIFT);
    const uint32_t op(bam_cigar[i] & BAM_CIGAR_MASK);
    apath[i].type = ((op <= BAM_CDIFF) ? static_cast<align_t>(1 + op) : NONE);
  }
}
