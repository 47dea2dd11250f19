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

#include "blt_util/known_pos_range2.hpp"

#include <iosfwd>
#include <set>
#include <vector>

/// sort pos range using end_pos as the primary sort key
struct PosRangeEndSort {
  bool operator()(const known_pos_range2& lhs, const known_pos_range2& rhs) const
  {
    if (lhs.end_pos() < rhs.end_pos()) return true;
    if (lhs.end_pos() == rhs.end_pos()) {
      if (lhs.begin_pos() < rhs.begin_pos()) return true;
    }
    return false;
  }
};

/// Aggregate multiple regions and support intersection and coverage queries against the full region set
///
/// Regions are stored in collapsed form, so that no two tracked regions overlap or abut.
///
struct RegionTracker {
  bool empty() const { return _regions.empty(); }

  void clear() { _regions.clear(); }

  /// is single position in a tracked region?
  bool isIntersectRegion(const pos_t pos) const { return isIntersectRegionImpl(pos, pos + 1); }

  /// does range intersect any tracked region?
  bool isIntersectRegion(const known_pos_range2& range) const
  {
    return isIntersectRegionImpl(range.begin_pos(), range.end_pos());
  }

  /// is range entirely contained in a region?
  bool isSubsetOfRegion(const known_pos_range2& range) const
  {
    return isSubsetOfRegionImpl(range.begin_pos(), range.end_pos());
  }

  /// add region
  ///
  /// any overlaps and adjacencies with existing regions in the tracker will be collapsed, empty ranges are
  /// ignored
  ///
  /// \return true if the tracked region set grew
  bool addRegion(known_pos_range2 range);

  /// get the tracked parts of range, in position order
  std::vector<known_pos_range2> getIntersectingRegions(const known_pos_range2& range) const;

  /// get the parts of range which are not tracked, in position order
  std::vector<known_pos_range2> getUncoveredRegions(const known_pos_range2& range) const;

  unsigned size() const { return _regions.size(); }

  typedef std::set<known_pos_range2, PosRangeEndSort> region_t;

private:
  bool isIntersectRegionImpl(const pos_t beginPos, const pos_t endPos) const;

  bool isSubsetOfRegionImpl(const pos_t beginPos, const pos_t endPos) const;

  region_t _regions;
};
