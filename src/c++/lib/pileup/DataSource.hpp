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
/// \brief interfaces to the external reference and alignment providers
///

#pragma once

#include "pileup/PileupAlignment.hpp"
#include "pileup/ReferenceBases.hpp"

#include <functional>
#include <string>
#include <vector>

/// \brief Outcome of one reference fetch
///
/// The bases may cover only part of the requested interval. A failed fetch sets errorMessage, and may still
/// carry the bases obtained before the failure.
struct ReferenceFetchResult {
  bool isError() const { return (!errorMessage.empty()); }

  GenomeInterval requestInterval;
  ReferenceBases bases;
  std::string    errorMessage;
};

/// \brief Outcome of one alignment fetch, or of one page of a paginated fetch
///
/// coveredInterval is the part of the requested interval for which this result delivers every alignment
/// the source has. A failed fetch sets errorMessage, and may still carry alignments and coverage obtained
/// before the failure.
struct AlignmentFetchResult {
  bool isError() const { return (!errorMessage.empty()); }

  GenomeInterval               requestInterval;
  GenomeInterval               coveredInterval;
  std::vector<PileupAlignment> alignments;
  std::string                  errorMessage;
};

/// \brief Asynchronous provider of reference sequence
///
/// fetch returns without blocking, the callback is invoked later, possibly after the caller which issued
/// the fetch has been destroyed. fetch may be called repeatedly for overlapping intervals.
struct ReferenceSource {
  typedef std::function<void(const ReferenceFetchResult&)> callback_t;

  virtual ~ReferenceSource() = default;

  virtual void fetch(const GenomeInterval& interval, callback_t callback) = 0;
};

/// \brief Asynchronous provider of read alignments
///
/// With isContainedOnly set, only alignments with a reference span fully inside interval are delivered,
/// otherwise every alignment intersecting interval is delivered. The callback may be invoked several times
/// for sub-ranges of one fetch.
struct AlignmentSource {
  typedef std::function<void(const AlignmentFetchResult&)> callback_t;

  virtual ~AlignmentSource() = default;

  virtual void fetch(const GenomeInterval& interval, const bool isContainedOnly, callback_t callback) = 0;
};
