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

#include "DumpPileup.hpp"
#include "DumpPileupOptions.hpp"

#include "blt_util/log.hpp"
#include "common/Exceptions.hpp"
#include "htsapi/BamAlignmentSource.hpp"
#include "htsapi/FastaReferenceSource.hpp"
#include "htsapi/samtools_fasta_util.hpp"
#include "pileup/GenomeIntervalUtil.hpp"
#include "pileup/PileupTrack.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

/// \brief Parse the region argument and clip it to the contig length
///
/// \throws InvalidParameterException if the region is malformed or not on a reference contig
static GenomeInterval getVisibleInterval(const DumpPileupOptions& opt)
{
  using namespace pileup::common;

  const GenomeInterval region(convertSamtoolsRegionToGenomeInterval(opt.region));

  const fasta_reader reference(opt.referenceFilename);
  if (!reference.has_contig(region.contig())) {
    std::ostringstream oss;
    oss << "Region contig '" << region.contig() << "' is not found in reference file '"
        << opt.referenceFilename << "'";
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
  }

  const pos_t contigLength(reference.get_contig_length(region.contig()));
  if (region.beginPos() >= contigLength) {
    std::ostringstream oss;
    oss << "Region '" << opt.region << "' starts beyond the end of contig '" << region.contig()
        << "' (length " << contigLength << ")";
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
  }
  return GenomeInterval(region.contig(), region.beginPos(), std::min(region.endPos(), contigLength));
}

/// \brief Open the output file, or return nullptr when records are written to stdout
///
/// \throws GeneralException if the file can't be opened for writing
static std::unique_ptr<std::ofstream> openOutputFile(const std::string& filename)
{
  using namespace pileup::common;

  if (filename.empty()) return nullptr;

  std::unique_ptr<std::ofstream> ofsPtr(new std::ofstream(filename.c_str()));
  if (!*ofsPtr) {
    std::ostringstream oss;
    oss << "Can't open output file: '" << filename << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }
  return ofsPtr;
}

static void runDumpPileup(const DumpPileupOptions& opt, const GenomeInterval& visibleInterval, std::ostream& os)
{
  using namespace pileup::common;

  DeliveryQueue        queue;
  FastaReferenceSource referenceSource(opt.referenceFilename, queue);
  BamAlignmentSource   alignmentSource(opt.alignmentFilename, opt.referenceFilename, queue);

  PileupTrack track(
      visibleInterval, referenceSource, alignmentSource, PileupTrack::renderer_t(), opt.isContainedOnly);
  track.requestData();
  queue.runPending();

  const RenderSet& renderSet(track.getRenderSet());
  for (const RenderRecord& record : renderSet) {
    os << record;
  }
  os.flush();

  log_os << "INFO: region: " << visibleInterval << " reference_window: " << track.getReferenceWindow()
         << " track_state: " << TRACK_STATE::label(track.getState())
         << " records: " << renderSet.size() << " rows: " << track.getRowCount()
         << " mismatches: " << getMismatchCount(renderSet)
         << " malformed_records: " << track.getAlignmentCache().getMalformedRecordCount() << "\n";

  if (track.getState() != TRACK_STATE::READY) {
    std::ostringstream oss;
    oss << "Failed to load all reference and alignment data for region " << visibleInterval
        << ", pileup track state is '" << TRACK_STATE::label(track.getState()) << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }
}

void DumpPileup::runInternal(int argc, char* argv[])
{
  DumpPileupOptions opt;
  parseDumpPileupOptions(*this, argc, argv, opt);

  // fail on an unwritable output before reading any input
  const std::unique_ptr<std::ofstream> outputFile(openOutputFile(opt.outputFilename));

  const GenomeInterval visibleInterval(getVisibleInterval(opt));
  setRegion(visibleInterval);

  runDumpPileup(opt, visibleInterval, outputFile ? *outputFile : std::cout);
}
