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

#include "boost/test/unit_test.hpp"

#include "htsapi/FastaReferenceSource.hpp"
#include "test/testAlignmentDataUtil.hpp"
#include "test/testFileMakers.hpp"

namespace {

/// collects the results of fetch callbacks
struct ReferenceResultLog {
  ReferenceSource::callback_t getCallback()
  {
    return [this](const ReferenceFetchResult& result) { results.push_back(result); };
  }

  std::vector<ReferenceFetchResult> results;
};

}  // namespace

BOOST_AUTO_TEST_SUITE(test_FastaReferenceSource)

BOOST_AUTO_TEST_CASE(test_FastaReferenceSource_Fetch)
{
  FastaFilenameMaker fastaFilename;
  buildTestFastaFile(getTestContigs(), fastaFilename.getFilename());

  DeliveryQueue        queue;
  FastaReferenceSource source(fastaFilename.getFilename(), queue);
  ReferenceResultLog   resultLog;

  const GenomeInterval interval("chrA", 10, 70);
  source.fetch(interval, resultLog.getCallback());

  // completion is deferred to the queue
  BOOST_REQUIRE(resultLog.results.empty());
  BOOST_REQUIRE_EQUAL(queue.size(), 1u);

  BOOST_REQUIRE_EQUAL(queue.runPending(), 1u);
  BOOST_REQUIRE_EQUAL(resultLog.results.size(), 1u);

  const ReferenceFetchResult& result(resultLog.results[0]);
  BOOST_REQUIRE(!result.isError());
  BOOST_REQUIRE_EQUAL(result.requestInterval, interval);
  BOOST_REQUIRE_EQUAL(result.bases.interval(), interval);
  BOOST_REQUIRE_EQUAL(result.bases.bases, getTestContigs()[0].bases.substr(10, 60));
}

BOOST_AUTO_TEST_CASE(test_FastaReferenceSource_ClipToContigEnd)
{
  FastaFilenameMaker fastaFilename;
  buildTestFastaFile(getTestContigs(), fastaFilename.getFilename());

  DeliveryQueue        queue;
  FastaReferenceSource source(fastaFilename.getFilename(), queue);
  ReferenceResultLog   resultLog;

  source.fetch(GenomeInterval("chrB", 90, 150), resultLog.getCallback());
  source.fetch(GenomeInterval("chrB", 100, 150), resultLog.getCallback());
  BOOST_REQUIRE_EQUAL(queue.runPending(), 2u);
  BOOST_REQUIRE_EQUAL(resultLog.results.size(), 2u);

  // partly past the contig end, the delivered bases stop at the contig end
  BOOST_REQUIRE(!resultLog.results[0].isError());
  BOOST_REQUIRE_EQUAL(resultLog.results[0].requestInterval, GenomeInterval("chrB", 90, 150));
  BOOST_REQUIRE_EQUAL(resultLog.results[0].bases.interval(), GenomeInterval("chrB", 90, 100));

  // entirely past the contig end
  BOOST_REQUIRE(resultLog.results[1].isError());
  BOOST_REQUIRE(resultLog.results[1].bases.empty());
}

BOOST_AUTO_TEST_CASE(test_FastaReferenceSource_Fail)
{
  FastaFilenameMaker fastaFilename;
  buildTestFastaFile(getTestContigs(), fastaFilename.getFilename());

  DeliveryQueue      queue;
  ReferenceResultLog resultLog;

  // unknown contig
  FastaReferenceSource source(fastaFilename.getFilename(), queue);
  source.fetch(GenomeInterval("chrC", 0, 10), resultLog.getCallback());

  // unreadable file, this fails at fetch time rather than at construction
  TestFilenameMaker    missingFilename;
  FastaReferenceSource missingSource(missingFilename.getFilename(), queue);
  missingSource.fetch(GenomeInterval("chrA", 0, 10), resultLog.getCallback());

  BOOST_REQUIRE_EQUAL(queue.runPending(), 2u);
  BOOST_REQUIRE_EQUAL(resultLog.results.size(), 2u);
  for (const ReferenceFetchResult& result : resultLog.results) {
    BOOST_REQUIRE(result.isError());
    BOOST_REQUIRE(result.bases.empty());
  }

  // the source is still usable after a failed fetch
  source.fetch(GenomeInterval("chrA", 0, 10), resultLog.getCallback());
  BOOST_REQUIRE_EQUAL(queue.runPending(), 1u);
  BOOST_REQUIRE(!resultLog.results.back().isError());
}

BOOST_AUTO_TEST_SUITE_END()
