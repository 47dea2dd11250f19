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

#include "blt_util/blt_types.hpp"

#include <iosfwd>
#include <string>

/// \brief A read base which disagrees with the reference base it is aligned to
struct Mismatch {
  Mismatch() : pos(0), basePair('N'), referenceBase('N') {}

  Mismatch(const std::string& initAlignmentId, const pos_t initPos, const char initBasePair, const char initReferenceBase)
    : alignmentId(initAlignmentId), pos(initPos), basePair(initBasePair), referenceBase(initReferenceBase)
  {
  }

  bool operator==(const Mismatch& rhs) const
  {
    return ((alignmentId == rhs.alignmentId) && (pos == rhs.pos) && (basePair == rhs.basePair) &&
            (referenceBase == rhs.referenceBase));
  }

  bool operator!=(const Mismatch& rhs) const { return (!(*this == rhs)); }

  std::string alignmentId;
  /// zero-indexed reference position
  pos_t pos;
  /// read symbol
  char basePair;
  char referenceBase;
};

/// prints "pos:ref>base"
std::ostream& operator<<(std::ostream& os, const Mismatch& mm);
