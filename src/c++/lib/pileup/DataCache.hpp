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

#include "blt_util/RegionTracker.hpp"
#include "pileup/CacheUpdate.hpp"
#include "pileup/CoverageState.hpp"

#include <map>
#include <string>
#include <vector>

/// \brief request and coverage bookkeeping shared by the reference and alignment caches
///
/// Coverage is the set of intervals for which the cache holds all data the source has. Requests are
/// remembered until they are covered, an outstanding request is one which is not yet fully covered.
struct DataCache : public CacheNotifier {
  explicit DataCache(const CACHE_FEED::index_t feed) : _feed(feed) {}

  CACHE_FEED::index_t feed() const { return _feed; }

  /// \brief readiness of the cache over interval
  ///
  /// COMPLETE if interval is fully covered, PARTIAL if any part of it is covered, PENDING if it intersects a
  /// request and UNREQUESTED otherwise.
  COVERAGE::state_t coverageOf(const GenomeInterval& interval) const;

  /// \return true if interval intersects a request which is not yet fully covered
  bool isOutstanding(const GenomeInterval& interval) const;

  /// number of fetches issued to the source
  unsigned getFetchCount() const { return _fetchCount; }

  /// number of requests currently waiting on the source
  unsigned getInFlightCount() const;

  /// the part of interval which is covered, in position order
  std::vector<GenomeInterval> getCoveredIntervals(const GenomeInterval& interval) const;

protected:
  /// \brief record a new request for interval
  ///
  /// \return true if the caller must issue a fetch for interval, false if it is covered already or is
  /// contained in a fetch which is still in flight
  bool registerRequest(const GenomeInterval& interval);

  /// the fetch issued for requestInterval has failed, matching requests stop being in flight
  void registerFetchFailure(const GenomeInterval& requestInterval);

  /// \return true if coverage grew
  bool addCoverage(const GenomeInterval& interval);

  /// \return the coverage tracker for contig, or nullptr if nothing is covered on contig
  const RegionTracker* getCoverage(const std::string& contig) const;

  void notifyUpdate(const GenomeInterval& interval) const
  {
    notify_observers(CacheUpdate(_feed, interval));
  }

private:
  struct FetchRequest {
    explicit FetchRequest(const GenomeInterval& initInterval) : interval(initInterval), isInFlight(true) {}

    GenomeInterval interval;
    bool           isInFlight;
  };

  bool isCovered(const GenomeInterval& interval) const;

  /// drop requests which are fully covered
  void updateRequests();

  const CACHE_FEED::index_t _feed;
  unsigned                  _fetchCount = 0;
  std::vector<FetchRequest> _requests;

  /// everything ever requested, per contig
  std::map<std::string, RegionTracker> _requested;
  std::map<std::string, RegionTracker> _coverage;
};
