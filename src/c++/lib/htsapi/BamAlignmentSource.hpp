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

#include "htsapi/bam_streamer.hpp"
#include "pileup/DataSource.hpp"
#include "pileup/DeliveryQueue.hpp"

#include <memory>
#include <string>

/// \brief Alignment source reading an indexed BAM or CRAM file through htslib
///
/// Each fetch is read and completed from the delivery queue, never from inside fetch(). An unreadable file,
/// a missing index or an unknown contig completes the fetch with an error. The source must outlive the
/// processing of every task it has posted to the queue.
struct BamAlignmentSource : public AlignmentSource {
  /// \param[in] referencePath reference FASTA, required to decode CRAM, may be empty for BAM
  BamAlignmentSource(const std::string& alignmentPath, const std::string& referencePath, DeliveryQueue& queue)
    : _alignmentPath(alignmentPath), _referencePath(referencePath), _queue(queue)
  {
  }

  void fetch(const GenomeInterval& interval, const bool isContainedOnly, callback_t callback) override;

  /// read interval immediately
  AlignmentFetchResult fetchNow(const GenomeInterval& interval, const bool isContainedOnly);

private:
  std::string                   _alignmentPath;
  std::string                   _referencePath;
  DeliveryQueue&                _queue;
  std::unique_ptr<bam_streamer> _streamer;
};

/// \brief Alignment id of a bam record
///
/// The id is the read name and read number, as "qname/1". Secondary and supplementary records append the
/// one-indexed position and CIGAR string, as "qname/1@1001:50S50M", so that every record of a read has a
/// distinct id.
std::string getBamRecordAlignmentId(const bam_record& bamRead);

/// \brief Convert a bam record into a pileup alignment
///
/// Records which do not store a read sequence are given a read of unknown bases with the length implied by
/// the CIGAR string.
PileupAlignment convertBamRecordToPileupAlignment(const bam_record& bamRead, const std::string& contig);
