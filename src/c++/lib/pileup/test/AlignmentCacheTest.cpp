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

#include "pileup/AlignmentCache.hpp"
#include "test/testDataSources.hpp"
#include "test/testPileupData.hpp"

namespace {

struct CacheUpdateRecorder : public CacheObserver {
  explicit CacheUpdateRecorder(const CacheNotifier& cache) { observe_notifier(cache); }

  std::vector<GenomeInterval> intervals;

private:
  void receive_notification(const CacheNotifier&, const CacheUpdate& cacheUpdate) override
  {
    BOOST_REQUIRE_EQUAL(cacheUpdate.feed, CACHE_FEED::ALIGNMENT);
    intervals.push_back(cacheUpdate.interval);
  }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(test_AlignmentCache)

BOOST_AUTO_TEST_CASE(test_AlignmentCache_DataFor)
{
  DeferredAlignmentSource               source(getScenarioAlignments());
  const std::shared_ptr<AlignmentCache> cache(AlignmentCache::create(source));
  CacheUpdateRecorder                   recorder(*cache);

  const GenomeInterval interval(getScenarioInterval());
  cache->request(interval);
  BOOST_REQUIRE_EQUAL(cache->coverageOf(interval), COVERAGE::PENDING);
  source.release();

  BOOST_REQUIRE_EQUAL(recorder.intervals.size(), 1u);
  BOOST_REQUIRE_EQUAL(cache->coverageOf(interval), COVERAGE::COMPLETE);

  // the distant read is not delivered, the unmapped read is stored but never returned
  const std::vector<const PileupAlignment*> data(cache->dataFor(interval));
  BOOST_REQUIRE_EQUAL(data.size(), 31u);
  BOOST_REQUIRE_EQUAL(cache->size(), 32u);
  BOOST_REQUIRE(cache->getAlignment("unmapped/2") != nullptr);
  BOOST_REQUIRE(cache->getAlignment("distant/1") == nullptr);

  // sorted by position then id
  BOOST_REQUIRE_EQUAL(data.front()->id, "upstream/1");
  for (unsigned i(1); i < data.size(); ++i) {
    BOOST_REQUIRE(data[i - 1]->pos <= data[i]->pos);
  }

  // upstream/1 starts before the interval, and 9 reads extend past its end
  BOOST_REQUIRE_EQUAL(cache->dataFor(interval, true).size(), 22u);
}

BOOST_AUTO_TEST_CASE(test_AlignmentCache_ContainedOnlyFetch)
{
  DeferredAlignmentSource               source(getScenarioAlignments());
  const std::shared_ptr<AlignmentCache> cache(AlignmentCache::create(source));

  cache->request(GenomeInterval("chr17", 7500700, 7500800), true);
  BOOST_REQUIRE(source.isLastFetchContainedOnly());
  source.release();

  // beside reads starting after 7500770 extend past the interval end
  for (const PileupAlignment* alignment : cache->dataFor(GenomeInterval("chr17", 7500700, 7500800))) {
    BOOST_REQUIRE(alignment->isContainedIn(GenomeInterval("chr17", 7500700, 7500800)));
  }
}

BOOST_AUTO_TEST_CASE(test_AlignmentCache_Deduplicate)
{
  DeferredAlignmentSource               source(getScenarioAlignments());
  const std::shared_ptr<AlignmentCache> cache(AlignmentCache::create(source));
  CacheUpdateRecorder                   recorder(*cache);

  // two overlapping requests, the second is not inside the first so both are fetched
  cache->request(GenomeInterval("chr17", 7500734, 7500770));
  cache->request(GenomeInterval("chr17", 7500760, 7500795));
  BOOST_REQUIRE_EQUAL(source.getFetchCount(), 2u);
  source.release();

  BOOST_REQUIRE_EQUAL(recorder.intervals.size(), 2u);
  BOOST_REQUIRE_EQUAL(cache->dataFor(getScenarioInterval()).size(), 31u);

  // a repeat of the whole delivery changes nothing
  cache->request(GenomeInterval("chr17", 7500700, 7500800));
  const unsigned sizeBefore(cache->size());
  source.release();
  BOOST_REQUIRE_EQUAL(cache->size(), sizeBefore);
  BOOST_REQUIRE_EQUAL(recorder.intervals.size(), 3u);

  AlignmentFetchResult repeat;
  repeat.requestInterval = getScenarioInterval();
  repeat.coveredInterval = getScenarioInterval();
  repeat.alignments      = getScenarioAlignments();
  cache->onDataArrived(repeat);
  BOOST_REQUIRE_EQUAL(recorder.intervals.size(), 3u);
}

BOOST_AUTO_TEST_CASE(test_AlignmentCache_PagedDelivery)
{
  DeferredAlignmentSource               source(getScenarioAlignments());
  const std::shared_ptr<AlignmentCache> cache(AlignmentCache::create(source));
  CacheUpdateRecorder                   recorder(*cache);

  const GenomeInterval interval(getScenarioInterval());
  cache->request(interval);
  source.releasePaged(4);

  BOOST_REQUIRE_EQUAL(recorder.intervals.size(), 4u);
  BOOST_REQUIRE_EQUAL(cache->coverageOf(interval), COVERAGE::COMPLETE);
  BOOST_REQUIRE_EQUAL(cache->dataFor(interval).size(), 31u);
}

BOOST_AUTO_TEST_CASE(test_AlignmentCache_MalformedRecord)
{
  const ReferenceBases& reference(getScenarioReference());

  std::vector<PileupAlignment> alignments;
  alignments.push_back(buildTestAlignment("good1/1", reference, 7500740, "20M"));
  alignments.push_back(buildTestAlignment("bad/1", reference, 7500742, "20M"));
  alignments.back().readBases.resize(15);
  alignments.push_back(buildTestAlignment("good2/1", reference, 7500744, "20M"));

  DeferredAlignmentSource               source(alignments);
  const std::shared_ptr<AlignmentCache> cache(AlignmentCache::create(source));
  CacheUpdateRecorder                   recorder(*cache);

  cache->request(getScenarioInterval());
  source.release();

  BOOST_REQUIRE_EQUAL(cache->getMalformedRecordCount(), 1u);
  BOOST_REQUIRE_EQUAL(cache->size(), 2u);
  BOOST_REQUIRE(cache->getAlignment("good2/1") != nullptr);
  BOOST_REQUIRE_EQUAL(recorder.intervals.size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_AlignmentCache_FetchFailure)
{
  DeferredAlignmentSource               source(getScenarioAlignments());
  const std::shared_ptr<AlignmentCache> cache(AlignmentCache::create(source));
  CacheUpdateRecorder                   recorder(*cache);

  const GenomeInterval interval(getScenarioInterval());
  cache->request(interval);
  source.fail("index not found");

  BOOST_REQUIRE(recorder.intervals.empty());
  BOOST_REQUIRE_EQUAL(cache->coverageOf(interval), COVERAGE::PENDING);

  cache->request(interval);
  BOOST_REQUIRE_EQUAL(source.getFetchCount(), 2u);
  source.release();
  BOOST_REQUIRE_EQUAL(cache->coverageOf(interval), COVERAGE::COMPLETE);
}

BOOST_AUTO_TEST_CASE(test_AlignmentCache_LateArrival)
{
  DeferredAlignmentSource source(getScenarioAlignments());
  {
    const std::shared_ptr<AlignmentCache> cache(AlignmentCache::create(source));
    cache->request(getScenarioInterval());
  }
  BOOST_REQUIRE_EQUAL(source.releasePaged(3), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
