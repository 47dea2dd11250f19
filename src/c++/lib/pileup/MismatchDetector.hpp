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
#include "pileup/PileupAlignment.hpp"
#include "pileup/ReferenceBases.hpp"

#include "boost/optional.hpp"

#include <vector>

/// mismatches found for one alignment, and the reference ranges it spans which could not be checked yet
struct MismatchResult {
  /// true when every aligned read base was compared against the reference
  bool isComplete() const { return pendingRanges.empty(); }

  std::vector<Mismatch>         mismatches;
  std::vector<known_pos_range2> pendingRanges;
};

/// \brief Finds read bases which disagree with the reference
///
/// The alignment path is walked with a read cursor and a reference cursor: match segments (M, =, X)
/// compare and advance both, insertions and soft clips advance the read, deletions and skips advance the
/// reference, hard clips and pads advance neither. Unknown bases on either side never mismatch. Reference
/// positions under a match segment which are not present in the reference segments are reported as
/// pending ranges instead.
struct MismatchDetector {
  /// \param[in] referenceSegments reference bases available, there is no requirement that these are
  /// contiguous or sorted
  explicit MismatchDetector(const std::vector<ReferenceBases>& referenceSegments)
    : _referenceSegments(referenceSegments)
  {
  }

  MismatchResult detect(const PileupAlignment& alignment) const;

private:
  boost::optional<char> getReferenceBase(const std::string& contig, const pos_t pos) const;

  const std::vector<ReferenceBases>& _referenceSegments;
};
