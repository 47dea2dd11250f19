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

#include "blt_util/RegionTracker.hpp"

#include "boost/optional.hpp"

#include <map>
#include <string>
#include <vector>

/// an item to be placed in the pileup layout
struct LayoutItem {
  LayoutItem(const std::string& initId, const known_pos_range2& initSpan) : id(initId), span(initSpan) {}

  std::string      id;
  known_pos_range2 span;
};

/// \brief Assigns each alignment a row so that no two alignments on one row overlap
///
/// Each batch is placed in order of span begin position, then id, and every item goes to the lowest row
/// with no occupied range intersecting its span. A new row is opened when no row is free. Items are never
/// moved once placed, a later batch places only its new items, using any gap left in existing rows. clear()
/// followed by a single batch of all items reproduces the layout of a fresh engine.
struct PileupLayout {
  /// place every item of batch which does not already have a row
  ///
  /// \return number of items newly placed
  unsigned addItems(const std::vector<LayoutItem>& batch);

  /// \return the row of id, or nothing if id has not been placed
  boost::optional<unsigned> getRow(const std::string& id) const;

  unsigned getRowCount() const { return _rows.size(); }

  unsigned size() const { return _itemRows.size(); }

  bool empty() const { return _itemRows.empty(); }

  void clear()
  {
    _rows.clear();
    _itemRows.clear();
  }

private:
  unsigned placeItem(const known_pos_range2& span);

  /// occupied ranges of each row
  std::vector<RegionTracker>      _rows;
  std::map<std::string, unsigned> _itemRows;
};
