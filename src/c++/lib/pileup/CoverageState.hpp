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

/// readiness of a data cache over one interval
namespace COVERAGE {
enum state_t {
  UNREQUESTED,  ///< no request intersects the interval and no data is available
  PENDING,      ///< requested, but no data is available yet
  PARTIAL,      ///< data is available for part of the interval
  COMPLETE      ///< data is available for the whole interval
};

inline const char* label(const state_t state)
{
  switch (state) {
  case UNREQUESTED:
    return "unrequested";
  case PENDING:
    return "pending";
  case PARTIAL:
    return "partial";
  case COMPLETE:
    return "complete";
  default:
    return "unknown";
  }
}

/// is any data available?
inline bool isAvailable(const state_t state)
{
  return ((state == PARTIAL) || (state == COMPLETE));
}
}  // namespace COVERAGE
