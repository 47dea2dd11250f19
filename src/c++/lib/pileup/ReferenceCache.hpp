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

#include "pileup/DataCache.hpp"
#include "pileup/DataSource.hpp"

#include "boost/optional.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

/// \brief Reference bases fetched so far, keyed by contig
///
/// Bases are standardized to [ACGTN] on arrival. Bases which are already cached are never overwritten by a
/// later delivery. Must be owned by a shared_ptr, fetch completions hold only a weak reference to the cache
/// so that completions arriving after the cache is destroyed are dropped.
class ReferenceCache : public DataCache, public std::enable_shared_from_this<ReferenceCache> {
public:
  static std::shared_ptr<ReferenceCache> create(ReferenceSource& source)
  {
    return std::shared_ptr<ReferenceCache>(new ReferenceCache(source));
  }

  /// register interest in interval, and fetch it from the source unless it is covered or in flight already
  void request(const GenomeInterval& interval);

  /// merge a fetch result into the cache, observers are notified if the result adds data intersecting an
  /// outstanding request
  void onDataArrived(const ReferenceFetchResult& result);

  /// \return all cached bases in interval, one entry for each contiguous covered stretch
  std::vector<ReferenceBases> dataFor(const GenomeInterval& interval) const;

  /// \return cached base at pos, or nothing if pos is not covered
  boost::optional<char> getBase(const std::string& contig, const pos_t pos) const;

private:
  explicit ReferenceCache(ReferenceSource& source) : DataCache(CACHE_FEED::REFERENCE), _source(source) {}

  /// \return true if any new base is cached
  bool mergeBases(const ReferenceBases& bases);

  /// copy a covered range from the stored segments
  std::string getSegmentBases(const std::string& contig, const known_pos_range2& range) const;

  /// stored segments for one contig keyed by begin position, no two segments overlap
  typedef std::map<pos_t, std::string> segments_t;

  ReferenceSource&                  _source;
  std::map<std::string, segments_t> _segments;
};
