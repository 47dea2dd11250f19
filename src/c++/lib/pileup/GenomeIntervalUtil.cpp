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

#include "pileup/GenomeIntervalUtil.hpp"

#include "common/Exceptions.hpp"

#include "boost/lexical_cast.hpp"

#include <cstring>

#include <limits>
#include <sstream>

static void regionParseError(const std::string& region, const char* reason)
{
  using namespace pileup::common;

  std::ostringstream oss;
  oss << "Can't parse " << reason << " from region '" << region << "'";
  BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
}

/// parse a 1-indexed position, allowing thousands separators (as in "7,500,765")
static pos_t parsePosition(const std::string& region, std::string word)
{
  std::string::size_type commaPos;
  while ((commaPos = word.find(',')) != std::string::npos) word.erase(commaPos, 1);

  try {
    return boost::lexical_cast<pos_t>(word);
  } catch (const boost::bad_lexical_cast&) {
    regionParseError(region, "begin and end positions");
  }
  return 0;
}

GenomeInterval convertSamtoolsRegionToGenomeInterval(const std::string& region)
{
  std::string contig(region);
  pos_t       beginPos(0);
  pos_t       endPos(std::numeric_limits<pos_t>::max());

  const std::string::size_type sepPos(region.rfind(':'));
  if (sepPos != std::string::npos) {
    const std::string positions(region.substr(sepPos + 1));
    const std::string::size_type dashPos(positions.find('-'));

    // this exception allows for contig names with colons (HLA...) but no positions included
    if (dashPos != std::string::npos) {
      contig   = region.substr(0, sepPos);
      beginPos = parsePosition(region, positions.substr(0, dashPos)) - 1;
      endPos   = parsePosition(region, positions.substr(dashPos + 1));
    }
  }

  if (contig.empty()) regionParseError(region, "contig name");

  if ((beginPos < 0) || (endPos <= beginPos)) {
    using namespace pileup::common;

    std::ostringstream oss;
    oss << "Nonsensical begin (" << beginPos << ") and end (" << endPos << ") positions parsed from region '"
        << region << "'";
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
  }

  return GenomeInterval(contig, beginPos, endPos);
}

std::string getSamtoolsRegionString(const GenomeInterval& gi)
{
  std::ostringstream oss;
  oss << gi.contig() << ":" << (gi.beginPos() + 1) << "-" << gi.endPos();
  return oss.str();
}
