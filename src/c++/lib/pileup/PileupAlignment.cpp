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

#include "pileup/PileupAlignment.hpp"

#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

known_pos_range2 PileupAlignment::refSpan() const
{
  return known_pos_range2(pos, pos + static_cast<pos_t>(ALIGNPATH::apath_ref_length(path)));
}

std::ostream& operator<<(std::ostream& os, const PileupAlignment& alignment)
{
  os << "PileupAlignment: " << alignment.id << " " << alignment.contig << ":" << alignment.pos << " "
     << ALIGNPATH::apath_to_cigar(alignment.path) << " mapped: " << alignment.isMapped
     << " readLength: " << alignment.readBases.size();
  return os;
}

void checkPileupAlignment(const PileupAlignment& alignment)
{
  using namespace ALIGNPATH;

  if (!alignment.isMapped) return;

  if (!is_apath_invalid(alignment.path, alignment.readBases.size())) return;

  using namespace pileup::common;
  std::ostringstream oss;
  oss << "Alignment '" << alignment.id << "' at " << alignment.contig << ":" << alignment.pos
      << " can't be placed against the reference: "
      << get_apath_invalid_reason(alignment.path, alignment.readBases.size()) << " (CIGAR "
      << apath_to_cigar(alignment.path) << ")";
  BOOST_THROW_EXCEPTION(MalformedRecordException(oss.str()));
}
