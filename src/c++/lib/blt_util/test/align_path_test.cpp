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

#include "blt_util/align_path.hpp"
#include "blt_util/blt_exception.hpp"

BOOST_AUTO_TEST_SUITE(test_align_path)

using namespace ALIGNPATH;

static void test_single_cigar_conversion(const std::string& input)
{
  path_t apath;
  cigar_to_apath(input.c_str(), apath);
  BOOST_REQUIRE_EQUAL(input, apath_to_cigar(apath));
}

BOOST_AUTO_TEST_CASE(test_align_path_cigar_conversion)
{
  path_t apath;
  cigar_to_apath("10I10M10D10M10S", apath);
  BOOST_REQUIRE_EQUAL(apath.size(), 5u);
  BOOST_REQUIRE(apath[2] == path_segment(DELETE, 10));

  test_single_cigar_conversion("10I10M2S20M2I10M10D10M");
  test_single_cigar_conversion("");
  test_single_cigar_conversion("5H3S10=1X4=");
}

BOOST_AUTO_TEST_CASE(test_align_path_cigar_cleanup)
{
  // padding and zero length segments are dropped, repeated segments are joined:
  path_t apath;
  cigar_to_apath("5M2P0I5M", apath);
  BOOST_REQUIRE_EQUAL(apath_to_cigar(apath), "10M");
}

BOOST_AUTO_TEST_CASE(test_align_path_bad_cigar)
{
  path_t apath;
  BOOST_REQUIRE_THROW(cigar_to_apath("10M5Q", apath), blt_exception);
  BOOST_REQUIRE_THROW(cigar_to_apath("M10", apath), blt_exception);
  BOOST_REQUIRE_THROW(cigar_to_apath("10M5", apath), blt_exception);
}

BOOST_AUTO_TEST_CASE(test_align_path_ref_length)
{
  path_t apath;
  cigar_to_apath("2I10M10D4I10M10N10M3S", apath);
  BOOST_REQUIRE_EQUAL(apath_ref_length(apath), 50u);
}

BOOST_AUTO_TEST_CASE(test_align_path_read_length)
{
  path_t apath;
  cigar_to_apath("2I10M10D4I10M10N10M3S", apath);
  BOOST_REQUIRE_EQUAL(apath_read_length(apath), 39u);

  cigar_to_apath("4H10M4H", apath);
  BOOST_REQUIRE_EQUAL(apath_read_length(apath), 10u);
}

BOOST_AUTO_TEST_CASE(test_align_path_invalid_type)
{
  path_t apath;
  cigar_to_apath("3S10M2I5M", apath);
  BOOST_REQUIRE_EQUAL(get_apath_invalid_type(apath, 20), ALIGN_ISSUE::NONE);
  BOOST_REQUIRE_EQUAL(get_apath_invalid_type(apath, 19), ALIGN_ISSUE::LENGTH);
  BOOST_REQUIRE(is_apath_invalid(apath, 21));
  BOOST_REQUIRE_EQUAL(
      get_apath_invalid_reason(apath, 19), "alignment length (20) does not match read length (19)");

  cigar_to_apath("10S", apath);
  BOOST_REQUIRE_EQUAL(get_apath_invalid_type(apath, 10), ALIGN_ISSUE::FLOATING);

  apath.clear();
  apath.push_back(path_segment(MATCH, 5));
  apath.push_back(path_segment(NONE, 5));
  BOOST_REQUIRE_EQUAL(get_apath_invalid_type(apath, 5), ALIGN_ISSUE::UNKNOWN_SEGMENT);
}

BOOST_AUTO_TEST_SUITE_END()
