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

#include "pileup/ReferenceBases.hpp"

#include <iostream>

std::ostream& operator<<(std::ostream& os, const ReferenceBases& rb)
{
  static const unsigned maxPrintLength(60);

  os << "ReferenceBases: " << rb.interval() << " ";
  if (rb.bases.size() > maxPrintLength) {
    os << rb.bases.substr(0, maxPrintLength) << "...";
  } else {
    os << rb.bases;
  }
  return os;
}
