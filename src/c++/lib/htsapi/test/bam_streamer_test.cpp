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

#include "blt_util/blt_exception.hpp"
#include "htsapi/bam_streamer.hpp"
#include "test/testAlignmentDataUtil.hpp"
#include "test/testFileMakers.hpp"

#include "boost/filesystem.hpp"
#include "boost/test/unit_test.hpp"

BOOST_AUTO_TEST_SUITE(bam_streamer_test_suite)

static void checkStream(bam_streamer& stream, const unsigned expectedCount)
{
  unsigned count(0);
  while (stream.next()) {
    const bam_record& read(*(stream.get_record_ptr()));
    if (!read.is_unmapped()) count++;
  }
  BOOST_REQUIRE_EQUAL(count, expectedCount);
}

BOOST_AUTO_TEST_CASE(test_bam_streamer_bam_read)
{
  BamFilenameMaker bamFilename;
  buildTestBamFile(getTestContigs(), getTestSamLines(), bamFilename.getFilename());

  // Assert that reference pointer is optional for BAM
  bam_streamer stream(bamFilename.getFilename().c_str(), nullptr);

  // no region has been set:
  checkStream(stream, 0u);

  // iterate through whole contigs:
  stream.resetRegion(stream.target_name_to_id("chrA"), 0, 200);
  checkStream(stream, 5u);

  stream.resetRegion(stream.target_name_to_id("chrB"), 0, 100);
  checkStream(stream, 1u);

  // iterate through a region, the first record overlapping [55,125) starts at 50:
  stream.resetRegion(stream.target_name_to_id("chrA"), 55, 125);
  BOOST_REQUIRE(stream.next());
  BOOST_REQUIRE_EQUAL(stream.get_record_ptr()->pos(), 51);
  checkStream(stream, 2u);
}

BOOST_AUTO_TEST_CASE(test_bam_streamer_read_record)
{
  BamFilenameMaker bamFilename;
  buildTestBamFile(getTestContigs(), getTestSamLines(), bamFilename.getFilename());

  bam_streamer stream(bamFilename.getFilename().c_str(), nullptr);
  stream.resetRegion(stream.target_name_to_id("chrA"), 120, 121);
  BOOST_REQUIRE(stream.next());

  const bam_record& read(*(stream.get_record_ptr()));
  BOOST_REQUIRE_EQUAL(std::string(read.qname()), "pair1");
  BOOST_REQUIRE_EQUAL(read.read_no(), 2);
  BOOST_REQUIRE_EQUAL(std::string(stream.target_id_to_name(read.target_id())), "chrA");

  std::string readString;
  read.get_read_string(readString);
  BOOST_REQUIRE_EQUAL(readString, getTestContigs()[0].bases.substr(120, 10));

  BOOST_REQUIRE(!stream.next());
}

BOOST_AUTO_TEST_CASE(test_bam_streamer_fail)
{
  // missing file:
  {
    TestFilenameMaker missingFilename;
    BOOST_REQUIRE_THROW(bam_streamer(missingFilename.getFilename().c_str(), nullptr), blt_exception);
  }

  BamFilenameMaker bamFilename;
  buildTestBamFile(getTestContigs(), getTestSamLines(), bamFilename.getFilename());
  bam_streamer stream(bamFilename.getFilename().c_str(), nullptr);

  // unknown contig:
  BOOST_REQUIRE(stream.target_name_to_id("chrC") < 0);
  BOOST_REQUIRE_THROW(stream.resetRegion(stream.target_name_to_id("chrC"), 0, 100), blt_exception);
}

BOOST_AUTO_TEST_CASE(test_bam_streamer_missing_index)
{
  BamFilenameMaker bamFilename;
  buildTestBamFile(getTestContigs(), getTestSamLines(), bamFilename.getFilename());
  boost::filesystem::remove(bamFilename.getFilename() + ".bai");

  bam_streamer stream(bamFilename.getFilename().c_str(), nullptr);
  BOOST_REQUIRE_THROW(stream.resetRegion(stream.target_name_to_id("chrA"), 0, 100), blt_exception);
}

BOOST_AUTO_TEST_SUITE_END()
