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

#include "blt_util/observer.hpp"
#include "pileup/GenomeInterval.hpp"

/// which data feed a cache holds
namespace CACHE_FEED {
enum index_t { REFERENCE, ALIGNMENT };

inline const char* label(const index_t i)
{
  switch (i) {
  case REFERENCE:
    return "reference";
  case ALIGNMENT:
    return "alignment";
  default:
    return "unknown";
  }
}
}  // namespace CACHE_FEED

/// message sent from a data cache to its observers when data covering an outstanding request has arrived
struct CacheUpdate {
  CacheUpdate(const CACHE_FEED::index_t initFeed, const GenomeInterval& initInterval)
    : feed(initFeed), interval(initInterval)
  {
  }

  CACHE_FEED::index_t feed;
  /// the newly covered interval
  GenomeInterval interval;
};

typedef notifier<CacheUpdate> CacheNotifier;
typedef observer<CacheUpdate> CacheObserver;
