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

#include "pileup/DataCache.hpp"

#include <algorithm>

COVERAGE::state_t DataCache::coverageOf(const GenomeInterval& interval) const
{
  const RegionTracker* coverage(getCoverage(interval.contig()));
  if (coverage != nullptr) {
    if (coverage->isSubsetOfRegion(interval.range())) return COVERAGE::COMPLETE;
    if (coverage->isIntersectRegion(interval.range())) return COVERAGE::PARTIAL;
  }

  const auto requestIter(_requested.find(interval.contig()));
  if (requestIter != _requested.end()) {
    if (requestIter->second.isIntersectRegion(interval.range())) return COVERAGE::PENDING;
  }
  return COVERAGE::UNREQUESTED;
}

bool DataCache::isOutstanding(const GenomeInterval& interval) const
{
  for (const FetchRequest& request : _requests) {
    if (request.interval.isIntersect(interval)) return true;
  }
  return false;
}

unsigned DataCache::getInFlightCount() const
{
  return std::count_if(
      _requests.begin(), _requests.end(), [](const FetchRequest& request) { return request.isInFlight; });
}

std::vector<GenomeInterval> DataCache::getCoveredIntervals(const GenomeInterval& interval) const
{
  std::vector<GenomeInterval> covered;
  const RegionTracker*        coverage(getCoverage(interval.contig()));
  if (coverage == nullptr) return covered;

  for (const known_pos_range2& range : coverage->getIntersectingRegions(interval.range())) {
    covered.emplace_back(interval.contig(), range);
  }
  return covered;
}

bool DataCache::registerRequest(const GenomeInterval& interval)
{
  if (interval.empty()) return false;

  _requested[interval.contig()].addRegion(interval.range());

  if (isCovered(interval)) return false;

  for (const FetchRequest& request : _requests) {
    if (request.isInFlight && request.interval.isSupersetOf(interval)) return false;
  }

  _fetchCount++;
  for (FetchRequest& request : _requests) {
    if (request.interval == interval) {
      request.isInFlight = true;
      return true;
    }
  }
  _requests.emplace_back(interval);
  return true;
}

void DataCache::registerFetchFailure(const GenomeInterval& requestInterval)
{
  for (FetchRequest& request : _requests) {
    if (request.interval == requestInterval) request.isInFlight = false;
  }
}

bool DataCache::addCoverage(const GenomeInterval& interval)
{
  if (interval.empty()) return false;
  if (!_coverage[interval.contig()].addRegion(interval.range())) return false;
  updateRequests();
  return true;
}

const RegionTracker* DataCache::getCoverage(const std::string& contig) const
{
  const auto coverageIter(_coverage.find(contig));
  if (coverageIter == _coverage.end()) return nullptr;
  return &(coverageIter->second);
}

bool DataCache::isCovered(const GenomeInterval& interval) const
{
  const RegionTracker* coverage(getCoverage(interval.contig()));
  if (coverage == nullptr) return false;
  return coverage->isSubsetOfRegion(interval.range());
}

void DataCache::updateRequests()
{
  _requests.erase(
      std::remove_if(
          _requests.begin(),
          _requests.end(),
          [this](const FetchRequest& request) { return isCovered(request.interval); }),
      _requests.end());
}
