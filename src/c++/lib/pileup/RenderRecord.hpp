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

#include "pileup/Mismatch.hpp"
#include "blt_util/known_pos_range2.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace RENDER_RECORD {
enum index_t { REFERENCE, PILEUP };

inline const char* label(const index_t i)
{
  switch (i) {
  case REFERENCE:
    return "REF";
  case PILEUP:
    return "READ";
  default:
    return "UNKNOWN";
  }
}
}  // namespace RENDER_RECORD

/// \brief One drawable element of a pileup track
///
/// A reference record carries one reference base. A pileup record carries an alignment with its row, its
/// reference span and the mismatches found so far in position order.
struct RenderRecord {
  static RenderRecord makeReference(const pos_t pos, const char basePair)
  {
    RenderRecord record(RENDER_RECORD::REFERENCE);
    record.pos      = pos;
    record.basePair = basePair;
    return record;
  }

  static RenderRecord makePileup(
      const std::string&           alignmentId,
      const unsigned               row,
      const known_pos_range2&      span,
      const std::vector<Mismatch>& mismatches)
  {
    RenderRecord record(RENDER_RECORD::PILEUP);
    record.pos         = span.begin_pos();
    record.alignmentId = alignmentId;
    record.row         = row;
    record.span        = span;
    record.mismatches  = mismatches;
    return record;
  }

  bool isReference() const { return (kind == RENDER_RECORD::REFERENCE); }

  bool operator==(const RenderRecord& rhs) const
  {
    return ((kind == rhs.kind) && (pos == rhs.pos) && (basePair == rhs.basePair) &&
            (alignmentId == rhs.alignmentId) && (row == rhs.row) && (span == rhs.span) &&
            (mismatches == rhs.mismatches));
  }

  bool operator!=(const RenderRecord& rhs) const { return (!(*this == rhs)); }

  RENDER_RECORD::index_t kind;
  pos_t                  pos = 0;

  // reference records:
  char basePair = 'N';

  // pileup records:
  std::string           alignmentId;
  unsigned              row = 0;
  known_pos_range2      span;
  std::vector<Mismatch> mismatches;

private:
  explicit RenderRecord(const RENDER_RECORD::index_t initKind) : kind(initKind) {}
};

/// ordered records of one emission: reference records by position, then pileup records by start and id
typedef std::vector<RenderRecord> RenderSet;

/// one line per record, fields are tab separated:
///
/// REF  <pos> <base>
/// READ <id> <row> <begin> <end> <mismatches>
///
/// where mismatches are comma separated "pos:ref>base" or "." if there are none
std::ostream& operator<<(std::ostream& os, const RenderRecord& record);

/// total mismatches over all pileup records
unsigned getMismatchCount(const RenderSet& renderSet);

/// all mismatches at pos
std::vector<Mismatch> getMismatchesAtPos(const RenderSet& renderSet, const pos_t pos);

/// \return true if no two pileup records on the same row overlap
bool isLayoutConsistent(const RenderSet& renderSet);
