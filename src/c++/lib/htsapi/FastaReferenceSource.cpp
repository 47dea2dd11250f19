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

#include "htsapi/FastaReferenceSource.hpp"

#include "blt_util/blt_exception.hpp"
#include "common/Exceptions.hpp"

#include <algorithm>
#include <sstream>

void FastaReferenceSource::fetch(const GenomeInterval& interval, callback_t callback)
{
  _queue.post([this, interval, callback]() { callback(fetchNow(interval)); });
}

ReferenceFetchResult FastaReferenceSource::fetchNow(const GenomeInterval& interval)
{
  using namespace pileup::common;

  ReferenceFetchResult result;
  result.requestInterval = interval;

  try {
    if (!_reader) _reader.reset(new fasta_reader(_fastaPath));

    if (!_reader->has_contig(interval.contig())) {
      std::ostringstream oss;
      oss << "Contig '" << interval.contig() << "' is not found in reference file '" << _fastaPath << "'";
      BOOST_THROW_EXCEPTION(FetchException(oss.str()));
    }

    const pos_t contigLength(_reader->get_contig_length(interval.contig()));
    const pos_t endPos(std::min(interval.endPos(), contigLength));
    if (endPos <= interval.beginPos()) {
      std::ostringstream oss;
      oss << "Requested interval " << interval << " is beyond the end of contig '" << interval.contig()
          << "' (length " << contigLength << ") in reference file '" << _fastaPath << "'";
      BOOST_THROW_EXCEPTION(FetchException(oss.str()));
    }

    std::string bases;
    _reader->get_region_seq(interval.contig(), interval.beginPos(), endPos, bases);
    result.bases = ReferenceBases(interval.contig(), interval.beginPos(), bases);
  } catch (const blt_exception& e) {
    result.errorMessage = e.what();
  } catch (const FetchException& e) {
    result.errorMessage = e.what();
  }
  return result;
}
