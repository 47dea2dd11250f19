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

#include "htsapi/samtools_fasta_util.hpp"
#include "pileup/DataSource.hpp"
#include "pileup/DeliveryQueue.hpp"

#include <memory>
#include <string>

/// \brief Reference source reading an indexed FASTA file through htslib
///
/// Each fetch is read and completed from the delivery queue, never from inside fetch(). The delivered
/// bases are clipped to the contig length. An unreadable file or an unknown contig completes the fetch with
/// an error. The source must outlive the processing of every task it has posted to the queue.
struct FastaReferenceSource : public ReferenceSource {
  FastaReferenceSource(const std::string& fastaPath, DeliveryQueue& queue) : _fastaPath(fastaPath), _queue(queue)
  {
  }

  void fetch(const GenomeInterval& interval, callback_t callback) override;

  /// read interval immediately
  ReferenceFetchResult fetchNow(const GenomeInterval& interval);

private:
  std::string                   _fastaPath;
  DeliveryQueue&                _queue;
  std::unique_ptr<fasta_reader> _reader;
};
