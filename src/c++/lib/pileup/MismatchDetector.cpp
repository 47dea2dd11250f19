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

#include "pileup/MismatchDetector.hpp"

#include "blt_util/seq_util.hpp"

/// extend the last pending range when pos continues it, otherwise open a new range
static void addPendingPos(const pos_t pos, std::vector<known_pos_range2>& pendingRanges)
{
  if ((!pendingRanges.empty()) && (pendingRanges.back().end_pos() == pos)) {
    pendingRanges.back().set_end_pos(pos + 1);
  } else {
    pendingRanges.emplace_back(pos, pos + 1);
  }
}

MismatchResult MismatchDetector::detect(const PileupAlignment& alignment) const
{
  using namespace ALIGNPATH;

  MismatchResult result;
  if (!alignment.isMapped) return result;

  pos_t readPos(0);
  pos_t refPos(alignment.pos);
  for (const path_segment& ps : alignment.path) {
    if (is_segment_align_match(ps.type)) {
      for (unsigned segmentOffset(0); segmentOffset < ps.length; ++segmentOffset) {
        const pos_t pos(refPos + segmentOffset);
        const boost::optional<char> refBase(getReferenceBase(alignment.contig, pos));
        if (!refBase) {
          addPendingPos(pos, result.pendingRanges);
          continue;
        }

        const unsigned readOffset(readPos + segmentOffset);
        if (readOffset >= alignment.readBases.size()) continue;

        const char readBase(alignment.readBases[readOffset]);
        if (is_unknown_base(readBase) || is_unknown_base(*refBase)) continue;
        if (standardize_base(readBase) == *refBase) continue;
        result.mismatches.emplace_back(alignment.id, pos, standardize_base(readBase), *refBase);
      }
    }

    if (is_segment_type_read_length(ps.type)) readPos += ps.length;
    if (is_segment_type_ref_length(ps.type)) refPos += ps.length;
  }

  return result;
}

boost::optional<char> MismatchDetector::getReferenceBase(const std::string& contig, const pos_t pos) const
{
  for (const ReferenceBases& segment : _referenceSegments) {
    if (segment.contig != contig) continue;
    if ((pos < segment.beginPos) || (pos >= (segment.beginPos + static_cast<pos_t>(segment.bases.size())))) continue;
    return standardize_base(segment.getBase(pos));
  }
  return boost::none;
}
