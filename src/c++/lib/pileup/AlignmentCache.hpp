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

#include <map>
#include <memory>
#include <string>
#include <vector>

/// \brief Alignments fetched so far, deduplicated by alignment id
///
/// Alignments accumulate over repeated and overlapping fetches. Records which can't be placed against the
/// reference are skipped and counted. Unmapped records are kept, but are never returned by dataFor. Must be
/// owned by a shared_ptr, for the same reason as ReferenceCache.
class AlignmentCache : public DataCache, public std::enable_shared_from_this<AlignmentCache> {
public:
  static std::shared_ptr<AlignmentCache> create(AlignmentSource& source)
  {
    return std::shared_ptr<AlignmentCache>(new AlignmentCache(source));
  }

  /// register interest in interval, and fetch it from the source unless it is covered or in flight already
  ///
  /// \param[in] isContainedOnly request only alignments fully inside interval
  void request(const GenomeInterval& interval, const bool isContainedOnly = false);

  /// merge a fetch result into the cache, observers are notified if the result adds alignments or coverage
  /// intersecting an outstanding request
  void onDataArrived(const AlignmentFetchResult& result);

  /// \return mapped alignments intersecting interval, or contained in it when isContainedOnly is set,
  /// sorted by position and then id
  ///
  /// The pointers are valid for the lifetime of the cache.
  std::vector<const PileupAlignment*> dataFor(const GenomeInterval& interval, const bool isContainedOnly = false) const;

  /// \return the alignment with id, or nullptr if none is cached
  const PileupAlignment* getAlignment(const std::string& id) const;

  /// number of alignments stored, including unmapped alignments
  unsigned size() const { return _alignments.size(); }

  /// number of records rejected as malformed
  unsigned getMalformedRecordCount() const { return _malformedRecordCount; }

private:
  explicit AlignmentCache(AlignmentSource& source) : DataCache(CACHE_FEED::ALIGNMENT), _source(source) {}

  /// \return true if alignment was not cached before
  bool addAlignment(const PileupAlignment& alignment);

  AlignmentSource&                       _source;
  std::map<std::string, PileupAlignment> _alignments;
  unsigned                               _malformedRecordCount = 0;
};
