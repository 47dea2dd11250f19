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

#include "pileup/GenomeInterval.hpp"

#include <iosfwd>
#include <string>

/// \brief A contiguous stretch of reference sequence starting at a zero-indexed position
struct ReferenceBases {
  ReferenceBases() : beginPos(0) {}

  ReferenceBases(const std::string& initContig, const pos_t initBeginPos, const std::string& initBases)
    : contig(initContig), beginPos(initBeginPos), bases(initBases)
  {
  }

  GenomeInterval interval() const
  {
    return GenomeInterval(contig, beginPos, beginPos + static_cast<pos_t>(bases.size()));
  }

  bool empty() const { return bases.empty(); }

  /// \return the base at pos, which must be in interval()
  char getBase(const pos_t pos) const { return bases[pos - beginPos]; }

  std::string contig;
  pos_t       beginPos;
  std::string bases;
};

std::ostream& operator<<(std::ostream& os, const ReferenceBases& rb);
