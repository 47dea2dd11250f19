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

#include "pileup/AlignmentCache.hpp"

#include "blt_util/log.hpp"
#include "common/Exceptions.hpp"

#include <algorithm>
#include <iostream>

void AlignmentCache::request(const GenomeInterval& interval, const bool isContainedOnly)
{
  if (!registerRequest(interval)) return;

  const std::weak_ptr<AlignmentCache> cachePtr(shared_from_this());
  _source.fetch(interval, isContainedOnly, [cachePtr](const AlignmentFetchResult& result) {
    const std::shared_ptr<AlignmentCache> cache(cachePtr.lock());
    if (!cache) return;
    cache->onDataArrived(result);
  });
}

void AlignmentCache::onDataArrived(const AlignmentFetchResult& result)
{
  if (result.isError()) {
    log_os << "WARNING: " << __FUNCTION__ << ": alignment fetch for " << result.requestInterval
           << " failed: " << result.errorMessage << "\n";
    registerFetchFailure(result.requestInterval);
  }

  bool isNotify(isOutstanding(result.coveredInterval));
  bool isChanged(false);
  for (const PileupAlignment& alignment : result.alignments) {
    try {
      checkPileupAlignment(alignment);
    } catch (const pileup::common::MalformedRecordException& e) {
      log_os << "WARNING: " << __FUNCTION__ << ": skipping malformed alignment record: " << e.what() << "\n";
      _malformedRecordCount++;
      continue;
    }

    if (!addAlignment(alignment)) continue;
    isChanged = true;
    if (alignment.isMapped && isOutstanding(alignment.refInterval())) isNotify = true;
  }

  if (addCoverage(result.coveredInterval)) isChanged = true;

  if (isNotify && isChanged) {
    notifyUpdate(result.coveredInterval.empty() ? result.requestInterval : result.coveredInterval);
  }
}

bool AlignmentCache::addAlignment(const PileupAlignment& alignment)
{
  return _alignments.insert(std::make_pair(alignment.id, alignment)).second;
}

std::vector<const PileupAlignment*> AlignmentCache::dataFor(
    const GenomeInterval& interval, const bool isContainedOnly) const
{
  std::vector<const PileupAlignment*> data;
  for (const auto& value : _alignments) {
    const PileupAlignment& alignment(value.second);
    if (!alignment.isMapped) continue;
    if (isContainedOnly) {
      if (!alignment.isContainedIn(interval)) continue;
    } else {
      if (!alignment.isIntersect(interval)) continue;
    }
    data.push_back(&alignment);
  }

  std::sort(data.begin(), data.end(), [](const PileupAlignment* a, const PileupAlignment* b) {
    if (a->pos != b->pos) return (a->pos < b->pos);
    return (a->id < b->id);
  });
  return data;
}

const PileupAlignment* AlignmentCache::getAlignment(const std::string& id) const
{
  const auto iter(_alignments.find(id));
  if (iter == _alignments.end()) return nullptr;
  return &(iter->second);
}
