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
/// \brief alignment paths (CIGAR) and the length queries needed to walk them
///

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace ALIGNPATH {

enum align_t { NONE, MATCH, INSERT, DELETE, SKIP, SOFT_CLIP, HARD_CLIP, PAD, SEQ_MATCH, SEQ_MISMATCH };

inline char segment_type_to_cigar_code(const align_t id)
{
  switch (id) {
  case MATCH:
    return 'M';
  case INSERT:
    return 'I';
  case DELETE:
    return 'D';
  case SKIP:
    return 'N';
  case SOFT_CLIP:
    return 'S';
  case HARD_CLIP:
    return 'H';
  case PAD:
    return 'P';
  case SEQ_MATCH:
    return '=';
  case SEQ_MISMATCH:
    return 'X';
  default:
    return '?';
  }
}

inline align_t cigar_code_to_segment_type(const char c)
{
  switch (c) {
  case 'M':
    return MATCH;
  case 'I':
    return INSERT;
  case 'D':
    return DELETE;
  case 'N':
    return SKIP;
  case 'S':
    return SOFT_CLIP;
  case 'H':
    return HARD_CLIP;
  case 'P':
    return PAD;
  case '=':
    return SEQ_MATCH;
  case 'X':
    return SEQ_MISMATCH;
  default:
    return NONE;
  }
}

/// does the segment consume read sequence?
inline bool is_segment_type_read_length(const align_t id)
{
  switch (id) {
  case MATCH:
  case INSERT:
  case SOFT_CLIP:
  case SEQ_MATCH:
  case SEQ_MISMATCH:
    return true;
  default:
    return false;
  }
}

/// does the segment consume reference positions?
inline bool is_segment_type_ref_length(const align_t id)
{
  switch (id) {
  case MATCH:
  case DELETE:
  case SKIP:
  case SEQ_MATCH:
  case SEQ_MISMATCH:
    return true;
  default:
    return false;
  }
}

/// does the segment place read bases against reference bases?
inline bool is_segment_align_match(const align_t id)
{
  switch (id) {
  case MATCH:
  case SEQ_MATCH:
  case SEQ_MISMATCH:
    return true;
  default:
    return false;
  }
}

struct path_segment {
  path_segment(const align_t t = NONE, const unsigned l = 0) : type(t), length(l) {}

  bool operator==(const path_segment& rhs) const { return ((type == rhs.type) and (length == rhs.length)); }

  bool operator!=(const path_segment& rhs) const { return (!(*this == rhs)); }

  align_t  type;
  unsigned length;
};

typedef std::vector<path_segment> path_t;

std::ostream& operator<<(std::ostream& os, const path_t& apath);

void apath_to_cigar(const path_t& apath, std::string& cigar);

inline std::string apath_to_cigar(const path_t& apath)
{
  std::string cigar;
  apath_to_cigar(apath, cigar);
  return cigar;
}

/// \brief Convert CIGAR string into apath format
///
/// Any padding or zero-length segments in the CIGAR string are removed, and adjacent segments of the same
/// type are joined. Throws blt_exception on an unparsable CIGAR string.
void cigar_to_apath(const char* cigar, path_t& apath);

/// \return The read length spanned by the path
unsigned apath_read_length(const path_t& apath);

/// \return The reference length spanned by the path
unsigned apath_ref_length(const path_t& apath);

namespace ALIGN_ISSUE {
enum issue_t { NONE, UNKNOWN_SEGMENT, FLOATING, LENGTH };

inline const char* description(const issue_t i)
{
  switch (i) {
  case UNKNOWN_SEGMENT:
    return "unknown segment in alignment";
  case FLOATING:
    return "alignment contains no match segments";
  case LENGTH:
    return "alignment length does not match read length";
  default:
    return "no error";
  }
}
}  // namespace ALIGN_ISSUE

/// check the alignment path for the problems which make it impossible to place the read against the
/// reference:
///
/// 1) no unknown segments
/// 2) must contain at least one match segment
/// 3) the read length implied by the path must equal seq_length
///
ALIGN_ISSUE::issue_t get_apath_invalid_type(const path_t& apath, const unsigned seq_length);

/// end-user description of the first issue found by get_apath_invalid_type
std::string get_apath_invalid_reason(const path_t& apath, const unsigned seq_length);

inline bool is_apath_invalid(const path_t& apath, const unsigned seq_length)
{
  return (ALIGN_ISSUE::NONE != get_apath_invalid_type(apath, seq_length));
}

}  // namespace ALIGNPATH
