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

#include "htsapi/BamAlignmentSource.hpp"

#include "blt_util/blt_exception.hpp"
#include "blt_util/log.hpp"
#include "blt_util/seq_util.hpp"
#include "common/Exceptions.hpp"
#include "htsapi/align_path_bam_util.hpp"

#include <sstream>

std::string getBamRecordAlignmentId(const bam_record& bamRead)
{
  std::ostringstream oss;
  oss << bamRead.qname() << "/" << bamRead.read_no();
  if (bamRead.is_secondary() || bamRead.is_supplementary()) {
    ALIGNPATH::path_t apath;
    bam_cigar_to_apath(bamRead.raw_cigar(), bamRead.n_cigar(), apath);
    oss << "@" << bamRead.pos() << ":" << ALIGNPATH::apath_to_cigar(apath);
  }
  return oss.str();
}

PileupAlignment convertBamRecordToPileupAlignment(const bam_record& bamRead, const std::string& contig)
{
  PileupAlignment alignment;
  alignment.id       = getBamRecordAlignmentId(bamRead);
  alignment.contig   = contig;
  alignment.pos      = bamRead.pos() - 1;
  alignment.isMapped = (!bamRead.is_unmapped());
  bam_cigar_to_apath(bamRead.raw_cigar(), bamRead.n_cigar(), alignment.path);
  bamRead.get_read_string(alignment.readBases);

  if (alignment.readBases.empty() && alignment.isMapped) {
    warnOnce("Alignment file contains records without a stored read sequence, these are shown with unknown bases");
    alignment.readBases.assign(ALIGNPATH::apath_read_length(alignment.path), UNKNOWN_BASE);
  }
  return alignment;
}

void BamAlignmentSource::fetch(const GenomeInterval& interval, const bool isContainedOnly, callback_t callback)
{
  _queue.post([this, interval, isContainedOnly, callback]() { callback(fetchNow(interval, isContainedOnly)); });
}

AlignmentFetchResult BamAlignmentSource::fetchNow(const GenomeInterval& interval, const bool isContainedOnly)
{
  using namespace pileup::common;

  AlignmentFetchResult result;
  result.requestInterval = interval;

  try {
    if (!_streamer) {
      _streamer.reset(new bam_streamer(
          _alignmentPath.c_str(), (_referencePath.empty() ? nullptr : _referencePath.c_str())));
    }

    const int32_t tid(_streamer->target_name_to_id(interval.contig().c_str()));
    if (tid < 0) {
      std::ostringstream oss;
      oss << "Contig '" << interval.contig() << "' is not found in alignment file '" << _alignmentPath << "'";
      BOOST_THROW_EXCEPTION(FetchException(oss.str()));
    }

    _streamer->resetRegion(tid, interval.beginPos(), interval.endPos());
    while (_streamer->next()) {
      const bam_record& bamRead(*(_streamer->get_record_ptr()));
      PileupAlignment   alignment(convertBamRecordToPileupAlignment(bamRead, interval.contig()));
      if (isContainedOnly && (!alignment.isContainedIn(interval))) continue;
      result.alignments.push_back(std::move(alignment));
    }
    result.coveredInterval = interval;
  } catch (const blt_exception& e) {
    result.errorMessage = e.what();
  } catch (const FetchException& e) {
    result.errorMessage = e.what();
  }
  return result;
}
