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

#include "pileup/ReferenceCache.hpp"

#include "blt_util/log.hpp"
#include "blt_util/seq_util.hpp"
#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

void ReferenceCache::request(const GenomeInterval& interval)
{
  if (!registerRequest(interval)) return;

  const std::weak_ptr<ReferenceCache> cachePtr(shared_from_this());
  _source.fetch(interval, [cachePtr](const ReferenceFetchResult& result) {
    const std::shared_ptr<ReferenceCache> cache(cachePtr.lock());
    if (!cache) return;
    cache->onDataArrived(result);
  });
}

void ReferenceCache::onDataArrived(const ReferenceFetchResult& result)
{
  if (result.isError()) {
    log_os << "WARNING: " << __FUNCTION__ << ": reference fetch for " << result.requestInterval
           << " failed: " << result.errorMessage << "\n";
    registerFetchFailure(result.requestInterval);
  }

  if (result.bases.empty()) return;

  const GenomeInterval delivered(result.bases.interval());
  const bool           isNotify(isOutstanding(delivered));
  if (mergeBases(result.bases) && isNotify) notifyUpdate(delivered);
}

bool ReferenceCache::mergeBases(const ReferenceBases& bases)
{
  const GenomeInterval delivered(bases.interval());
  segments_t&          segments(_segments[bases.contig]);

  std::vector<known_pos_range2> gaps;
  const RegionTracker*          coverage(getCoverage(bases.contig));
  if (coverage == nullptr) {
    gaps.push_back(delivered.range());
  } else {
    gaps = coverage->getUncoveredRegions(delivered.range());
  }

  for (const known_pos_range2& gap : gaps) {
    std::string gapBases(bases.bases.substr(gap.begin_pos() - bases.beginPos, gap.size()));
    standardize_seq(gapBases);
    segments.insert(std::make_pair(gap.begin_pos(), gapBases));
  }

  return addCoverage(delivered);
}

std::vector<ReferenceBases> ReferenceCache::dataFor(const GenomeInterval& interval) const
{
  std::vector<ReferenceBases> data;
  for (const GenomeInterval& covered : getCoveredIntervals(interval)) {
    data.emplace_back(covered.contig(), covered.beginPos(), getSegmentBases(covered.contig(), covered.range()));
  }
  return data;
}

boost::optional<char> ReferenceCache::getBase(const std::string& contig, const pos_t pos) const
{
  const auto contigIter(_segments.find(contig));
  if (contigIter == _segments.end()) return boost::none;

  const segments_t& segments(contigIter->second);
  auto              segmentIter(segments.upper_bound(pos));
  if (segmentIter == segments.begin()) return boost::none;
  --segmentIter;

  const pos_t offset(pos - segmentIter->first);
  if (offset >= static_cast<pos_t>(segmentIter->second.size())) return boost::none;
  return segmentIter->second[offset];
}

std::string ReferenceCache::getSegmentBases(const std::string& contig, const known_pos_range2& range) const
{
  std::string rangeBases;

  const auto contigIter(_segments.find(contig));
  if (contigIter != _segments.end()) {
    const segments_t& segments(contigIter->second);
    auto              segmentIter(segments.upper_bound(range.begin_pos()));
    if (segmentIter != segments.begin()) --segmentIter;

    for (; segmentIter != segments.end(); ++segmentIter) {
      const pos_t segmentBegin(segmentIter->first);
      if (segmentBegin >= range.end_pos()) break;

      const known_pos_range2                  segmentRange(segmentBegin, segmentBegin + segmentIter->second.size());
      const boost::optional<known_pos_range2> olap(intersect_range(segmentRange, range));
      if (!olap) continue;
      rangeBases += segmentIter->second.substr(olap->begin_pos() - segmentBegin, olap->size());
    }
  }

  if (rangeBases.size() != range.size()) {
    using namespace pileup::common;
    std::ostringstream oss;
    oss << "Cached reference bases do not fill covered range " << contig << ":" << range;
    BOOST_THROW_EXCEPTION(LogicException(oss.str()));
  }
  return rangeBases;
}
