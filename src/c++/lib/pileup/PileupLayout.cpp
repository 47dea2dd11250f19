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

#include "pileup/PileupLayout.hpp"

#include <algorithm>

unsigned PileupLayout::addItems(const std::vector<LayoutItem>& batch)
{
  std::vector<const LayoutItem*> newItems;
  for (const LayoutItem& item : batch) {
    if (_itemRows.count(item.id) != 0) continue;
    newItems.push_back(&item);
  }

  std::sort(newItems.begin(), newItems.end(), [](const LayoutItem* a, const LayoutItem* b) {
    if (a->span.begin_pos() != b->span.begin_pos()) return (a->span.begin_pos() < b->span.begin_pos());
    return (a->id < b->id);
  });

  unsigned placedCount(0);
  for (const LayoutItem* itemPtr : newItems) {
    // repeated ids within one batch are placed once
    if (_itemRows.count(itemPtr->id) != 0) continue;
    _itemRows[itemPtr->id] = placeItem(itemPtr->span);
    placedCount++;
  }
  return placedCount;
}

boost::optional<unsigned> PileupLayout::getRow(const std::string& id) const
{
  const auto iter(_itemRows.find(id));
  if (iter == _itemRows.end()) return boost::none;
  return iter->second;
}

unsigned PileupLayout::placeItem(const known_pos_range2& span)
{
  // a zero-length span still occupies its begin position, so that it is never drawn over another item
  known_pos_range2 occupied(span);
  if (occupied.empty()) occupied.set_end_pos(occupied.begin_pos() + 1);

  const unsigned rowCount(_rows.size());
  for (unsigned rowIndex(0); rowIndex < rowCount; ++rowIndex) {
    RegionTracker& row(_rows[rowIndex]);
    if (row.isIntersectRegion(occupied)) continue;
    row.addRegion(occupied);
    return rowIndex;
  }

  _rows.emplace_back();
  _rows.back().addRegion(occupied);
  return rowCount;
}
