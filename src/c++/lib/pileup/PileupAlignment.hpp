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

#include "blt_util/align_path.hpp"
#include "pileup/GenomeInterval.hpp"

#include <iosfwd>
#include <string>

/// \brief A single read alignment as delivered by an alignment source
///
/// The id is unique within an alignment source and stable across re-fetches, so it can be used to
/// deduplicate alignments delivered by overlapping requests.
struct PileupAlignment {
  PileupAlignment() : pos(0), isMapped(true) {}

  PileupAlignment(
      const std::string&     initId,
      const std::string&     initContig,
      const pos_t            initPos,
      const ALIGNPATH::path_t& initPath,
      const std::string&     initReadBases,
      const bool             initIsMapped = true)
    : id(initId), contig(initContig), pos(initPos), path(initPath), readBases(initReadBases), isMapped(initIsMapped)
  {
  }

  /// \return the reference positions covered by the alignment path
  known_pos_range2 refSpan() const;

  /// \return refSpan() on the alignment contig
  GenomeInterval refInterval() const { return GenomeInterval(contig, refSpan()); }

  /// \return true if the alignment reference span is contained in interval
  bool isContainedIn(const GenomeInterval& interval) const { return interval.isSupersetOf(refInterval()); }

  /// \return true if the alignment reference span intersects interval
  bool isIntersect(const GenomeInterval& interval) const { return interval.isIntersect(refInterval()); }

  std::string       id;
  std::string       contig;
  /// zero-indexed reference position of the first reference-consuming path segment
  pos_t             pos;
  ALIGNPATH::path_t path;
  std::string       readBases;
  bool              isMapped;
};

std::ostream& operator<<(std::ostream& os, const PileupAlignment& alignment);

/// Check that a mapped alignment can be placed against the reference
///
/// The path must contain only known segments, at least one segment placing read bases against the
/// reference, and must imply a read length equal to the length of readBases. Unmapped alignments are
/// never checked.
///
/// \throws MalformedRecordException describing the first problem found
void checkPileupAlignment(const PileupAlignment& alignment);
