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

#include "pileup/GenomeInterval.hpp"

#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

GenomeInterval::GenomeInterval(const std::string& initContig, const pos_t beginPos, const pos_t endPos)
  : _contig(initContig), _range(beginPos, endPos)
{
  if (endPos < beginPos) {
    using namespace pileup::common;

    std::ostringstream oss;
    oss << "Genome interval on contig '" << initContig << "' has end position (" << endPos
        << ") before begin position (" << beginPos << ")";
    BOOST_THROW_EXCEPTION(PreConditionException(oss.str()));
  }
}

boost::optional<GenomeInterval> GenomeInterval::intersect(const GenomeInterval& gi) const
{
  if (_contig != gi._contig) return boost::none;
  const boost::optional<known_pos_range2> olap(intersect_range(_range, gi._range));
  if (!olap) return boost::none;
  return GenomeInterval(_contig, *olap);
}

std::ostream& operator<<(std::ostream& os, const GenomeInterval& gi)
{
  os << gi.contig() << ":" << gi.range();
  return os;
}
