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
/// \brief base symbol handling for reference and read sequence
///

#pragma once

#include <string>

/// symbol used for any base which is not known to be one of [ACGT]
const char UNKNOWN_BASE('N');

/// reduce any sequence symbol to one of [ACGTN]
///
/// lower case (soft-masked) bases are upper-cased, 'U' is read as 'T', and every other symbol (IUPAC
/// ambiguity codes, gap characters, unexpected bytes) becomes UNKNOWN_BASE
inline char standardize_base(const char a)
{
  switch (a) {
  case 'A':
  case 'a':
    return 'A';
  case 'C':
  case 'c':
    return 'C';
  case 'G':
  case 'g':
    return 'G';
  case 'T':
  case 't':
  case 'U':
  case 'u':
    return 'T';
  default:
    return UNKNOWN_BASE;
  }
}

inline bool is_unknown_base(const char a)
{
  return (standardize_base(a) == UNKNOWN_BASE);
}

/// standardize every symbol of seq in place
inline void standardize_seq(std::string& seq)
{
  for (char& c : seq) c = standardize_base(c);
}
