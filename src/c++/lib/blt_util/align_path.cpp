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

#include "blt_util/align_path.hpp"
#include "blt_util/blt_exception.hpp"

#include "boost/lexical_cast.hpp"

#include <cassert>
#include <cctype>

#include <iostream>
#include <sstream>

static void unknown_cigar_error(const char* const cigar, const char* const cptr)
{
  std::ostringstream oss;
  oss << "Can't parse cigar string: " << cigar << "\n"
      << "\tunexpected character: '" << *cptr << "' at position: " << (cptr - cigar + 1);
  throw blt_exception(oss.str().c_str());
}

namespace ALIGNPATH {

void apath_to_cigar(const path_t& apath, std::string& cigar)
{
  cigar.clear();
  for (const path_segment& ps : apath) {
    cigar += boost::lexical_cast<std::string>(ps.length);
    cigar.push_back(segment_type_to_cigar_code(ps.type));
  }
}

std::ostream& operator<<(std::ostream& os, const path_t& apath)
{
  for (const path_segment& ps : apath) {
    os << ps.length << segment_type_to_cigar_code(ps.type);
  }
  return os;
}

void cigar_to_apath(const char* cigar, path_t& apath)
{
  assert(nullptr != cigar);

  apath.clear();

  path_segment lps;
  const char*  cptr(cigar);
  while (*cptr) {
    // expect sequences of digits and cigar codes:
    if (!isdigit(*cptr)) unknown_cigar_error(cigar, cptr);
    unsigned length(0);
    for (; isdigit(*cptr); ++cptr) {
      length = (length * 10) + static_cast<unsigned>(*cptr - '0');
    }
    if ('\0' == *cptr) unknown_cigar_error(cigar, cptr - 1);

    const path_segment ps(cigar_code_to_segment_type(*cptr), length);
    if (ps.type == NONE) unknown_cigar_error(cigar, cptr);
    cptr++;
    if ((ps.type == PAD) || (ps.length == 0)) continue;

    if (ps.type != lps.type) {
      if (lps.type != NONE) apath.push_back(lps);
      lps = ps;
    } else {
      lps.length += ps.length;
    }
  }

  if (lps.type != NONE) apath.push_back(lps);
}

unsigned apath_read_length(const path_t& apath)
{
  unsigned val(0);
  for (const path_segment& ps : apath) {
    if (!is_segment_type_read_length(ps.type)) continue;
    val += ps.length;
  }
  return val;
}

unsigned apath_ref_length(const path_t& apath)
{
  unsigned val(0);
  for (const path_segment& ps : apath) {
    if (!is_segment_type_ref_length(ps.type)) continue;
    val += ps.length;
  }
  return val;
}

/// true if no segment places a read base against the reference
static bool is_apath_floating(const path_t& apath)
{
  for (const path_segment& ps : apath) {
    if (is_segment_align_match(ps.type) && (ps.length > 0)) return false;
  }
  return true;
}

ALIGN_ISSUE::issue_t get_apath_invalid_type(const path_t& apath, const unsigned seq_length)
{
  for (const path_segment& ps : apath) {
    if (ps.type == NONE) return ALIGN_ISSUE::UNKNOWN_SEGMENT;
  }

  if (is_apath_floating(apath)) return ALIGN_ISSUE::FLOATING;

  if (seq_length != apath_read_length(apath)) return ALIGN_ISSUE::LENGTH;

  return ALIGN_ISSUE::NONE;
}

std::string get_apath_invalid_reason(const path_t& apath, const unsigned seq_length)
{
  const ALIGN_ISSUE::issue_t ai(get_apath_invalid_type(apath, seq_length));

  if (ALIGN_ISSUE::LENGTH == ai) {
    std::ostringstream oss;
    oss << "alignment length (" << apath_read_length(apath) << ") does not match read length (" << seq_length
        << ")";
    return oss.str();
  }

  return std::string(ALIGN_ISSUE::description(ai));
}

}  // namespace ALIGNPATH
