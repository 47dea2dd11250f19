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

#include "pileup/RenderRecord.hpp"

#include "blt_util/RegionTracker.hpp"

#include <iostream>
#include <map>

std::ostream& operator<<(std::ostream& os, const RenderRecord& record)
{
  os << RENDER_RECORD::label(record.kind);
  if (record.isReference()) {
    os << '\t' << record.pos << '\t' << record.basePair << '\n';
    return os;
  }

  os << '\t' << record.alignmentId << '\t' << record.row << '\t' << record.span.begin_pos() << '\t'
     << record.span.end_pos() << '\t';
  if (record.mismatches.empty()) {
    os << '.';
  } else {
    bool isFirst(true);
    for (const Mismatch& mm : record.mismatches) {
      if (!isFirst) os << ',';
      os << mm;
      isFirst = false;
    }
  }
  os << '\n';
  return os;
}

unsigned getMismatchCount(const RenderSet& renderSet)
{
  unsigned count(0);
  for (const RenderRecord& record : renderSet) {
    count += record.mismatches.size();
  }
  return count;
}

std::vector<Mismatch> getMismatchesAtPos(const RenderSet& renderSet, const pos_t pos)
{
  std::vector<Mismatch> posMismatches;
  for (const RenderRecord& record : renderSet) {
    for (const Mismatch& mm : record.mismatches) {
      if (mm.pos == pos) posMismatches.push_back(mm);
    }
  }
  return posMismatches;
}

bool isLayoutConsistent(const RenderSet& renderSet)
{
  std::map<unsigned, RegionTracker> rows;
  for (const RenderRecord& record : renderSet) {
    if (record.isReference()) continue;
    known_pos_range2 occupied(record.span);
    if (occupied.empty()) occupied.set_end_pos(occupied.begin_pos() + 1);

    RegionTracker& row(rows[record.row]);
    if (row.isIntersectRegion(occupied)) return false;
    row.addRegion(occupied);
  }
  return true;
}
