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

#include "blt_util/RegionTracker.hpp"

BOOST_AUTO_TEST_SUITE(test_RegionTracker)

BOOST_AUTO_TEST_CASE(test_RegionTrackerSimple)
{
  // Simplest test
  RegionTracker rt;

  BOOST_REQUIRE(rt.addRegion(known_pos_range2(0, 1)));
  BOOST_REQUIRE(rt.isIntersectRegion(0));
  BOOST_REQUIRE(!rt.isIntersectRegion(1));
}

BOOST_AUTO_TEST_CASE(test_RegionTrackerPosIntersect)
{
  // region overlap tests
  {
    RegionTracker rt;

    rt.addRegion(known_pos_range2(5, 10));
    rt.addRegion(known_pos_range2(2, 3));
    BOOST_REQUIRE_EQUAL(rt.size(), 2u);
    BOOST_REQUIRE(rt.isIntersectRegion(2));
    BOOST_REQUIRE(!rt.isIntersectRegion(3));
    BOOST_REQUIRE(!rt.isIntersectRegion(4));
    BOOST_REQUIRE(rt.isIntersectRegion(5));

    rt.addRegion(known_pos_range2(3, 7));
    BOOST_REQUIRE_EQUAL(rt.size(), 1u);
    BOOST_REQUIRE(rt.isIntersectRegion(4));
  }
  {
    RegionTracker rt;
    rt.addRegion(known_pos_range2(5, 10));
    rt.addRegion(known_pos_range2(2, 3));
    rt.addRegion(known_pos_range2(4, 5));
    BOOST_REQUIRE_EQUAL(rt.size(), 2u);
    BOOST_REQUIRE(rt.isIntersectRegion(4));
  }
  {
    RegionTracker rt;
    rt.addRegion(known_pos_range2(4, 5));
    rt.addRegion(known_pos_range2(1, 10));
    BOOST_REQUIRE_EQUAL(rt.size(), 1u);
    BOOST_REQUIRE(rt.isIntersectRegion(4));
  }
}

BOOST_AUTO_TEST_CASE(test_RegionTrackerRegionIntersect)
{
  RegionTracker rt;

  rt.addRegion(known_pos_range2(5, 10));
  rt.addRegion(known_pos_range2(2, 3));
  BOOST_REQUIRE(rt.isIntersectRegion(known_pos_range2(2, 10)));
  BOOST_REQUIRE(!rt.isIntersectRegion(known_pos_range2(3, 4)));
  BOOST_REQUIRE(!rt.isIntersectRegion(known_pos_range2(4, 4)));
  BOOST_REQUIRE(!rt.isIntersectRegion(known_pos_range2(6, 6)));
  BOOST_REQUIRE(rt.isIntersectRegion(known_pos_range2(5, 11)));
}

BOOST_AUTO_TEST_CASE(test_RegionTrackerSubset)
{
  RegionTracker rt;

  rt.addRegion(known_pos_range2(5, 10));
  BOOST_REQUIRE(rt.isSubsetOfRegion(known_pos_range2(5, 10)));
  BOOST_REQUIRE(rt.isSubsetOfRegion(known_pos_range2(6, 9)));
  BOOST_REQUIRE(!rt.isSubsetOfRegion(known_pos_range2(4, 9)));
  BOOST_REQUIRE(!rt.isSubsetOfRegion(known_pos_range2(6, 11)));

  // adjacent additions collapse into one region:
  rt.addRegion(known_pos_range2(10, 20));
  BOOST_REQUIRE_EQUAL(rt.size(), 1u);
  BOOST_REQUIRE(rt.isSubsetOfRegion(known_pos_range2(5, 20)));
}

BOOST_AUTO_TEST_CASE(test_RegionTrackerAddReportsGrowth)
{
  RegionTracker rt;

  BOOST_REQUIRE(rt.addRegion(known_pos_range2(5, 10)));
  BOOST_REQUIRE(!rt.addRegion(known_pos_range2(5, 10)));
  BOOST_REQUIRE(!rt.addRegion(known_pos_range2(6, 8)));
  BOOST_REQUIRE(!rt.addRegion(known_pos_range2(3, 3)));
  BOOST_REQUIRE(rt.addRegion(known_pos_range2(8, 12)));
  BOOST_REQUIRE_EQUAL(rt.size(), 1u);
  BOOST_REQUIRE(rt.isSubsetOfRegion(known_pos_range2(5, 12)));
}

BOOST_AUTO_TEST_CASE(test_RegionTrackerCoveredAndUncovered)
{
  RegionTracker rt;
  rt.addRegion(known_pos_range2(10, 20));
  rt.addRegion(known_pos_range2(30, 40));

  const known_pos_range2 query(15, 35);

  const std::vector<known_pos_range2> covered(rt.getIntersectingRegions(query));
  BOOST_REQUIRE_EQUAL(covered.size(), 2u);
  BOOST_REQUIRE_EQUAL(covered[0], known_pos_range2(15, 20));
  BOOST_REQUIRE_EQUAL(covered[1], known_pos_range2(30, 35));

  const std::vector<known_pos_range2> gaps(rt.getUncoveredRegions(query));
  BOOST_REQUIRE_EQUAL(gaps.size(), 1u);
  BOOST_REQUIRE_EQUAL(gaps[0], known_pos_range2(20, 30));

  const std::vector<known_pos_range2> edgeGaps(rt.getUncoveredRegions(known_pos_range2(0, 50)));
  BOOST_REQUIRE_EQUAL(edgeGaps.size(), 3u);
  BOOST_REQUIRE_EQUAL(edgeGaps[0], known_pos_range2(0, 10));
  BOOST_REQUIRE_EQUAL(edgeGaps[2], known_pos_range2(40, 50));

  BOOST_REQUIRE(rt.getUncoveredRegions(known_pos_range2(11, 19)).empty());
  BOOST_REQUIRE(rt.getIntersectingRegions(known_pos_range2(20, 30)).empty());
}

BOOST_AUTO_TEST_SUITE_END()
