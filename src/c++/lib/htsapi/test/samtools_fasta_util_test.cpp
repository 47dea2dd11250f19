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
#include "htsapi/samtools_fasta_util.hpp"
#include "test/testAlignmentDataUtil.hpp"
#include "test/testFileMakers.hpp"

#include "boost/test/unit_test.hpp"

BOOST_AUTO_TEST_SUITE(test_samtools_fasta_util)

BOOST_AUTO_TEST_CASE(test_fasta_reader)
{
  FastaFilenameMaker fastaFilename;
  buildTestFastaFile(getTestContigs(), fastaFilename.getFilename());

  const fasta_reader reader(fastaFilename.getFilename());
  BOOST_REQUIRE(reader.has_contig("chrA"));
  BOOST_REQUIRE(reader.has_contig("chrB"));
  BOOST_REQUIRE(!reader.has_contig("chrC"));

  BOOST_REQUIRE_EQUAL(reader.get_contig_length("chrA"), 200u);
  BOOST_REQUIRE_EQUAL(reader.get_contig_length("chrB"), 100u);
  BOOST_REQUIRE_THROW(reader.get_contig_length("chrC"), blt_exception);

  // region crossing a FASTA line break:
  std::string refSeq;
  reader.get_region_seq("chrA", 55, 125, refSeq);
  BOOST_REQUIRE_EQUAL(refSeq, getTestContigs()[0].bases.substr(55, 70));

  reader.get_region_seq("chrB", 90, 100, refSeq);
  BOOST_REQUIRE_EQUAL(refSeq, getTestContigs()[1].bases.substr(90, 10));

  // empty region:
  reader.get_region_seq("chrB", 10, 10, refSeq);
  BOOST_REQUIRE(refSeq.empty());
}

BOOST_AUTO_TEST_CASE(test_fasta_reader_fail)
{
  {
    TestFilenameMaker missingFilename;
    BOOST_REQUIRE_THROW(fasta_reader(missingFilename.getFilename()), blt_exception);
  }

  FastaFilenameMaker fastaFilename;
  buildTestFastaFile(getTestContigs(), fastaFilename.getFilename());
  const fasta_reader reader(fastaFilename.getFilename());

  std::string refSeq;
  BOOST_REQUIRE_THROW(reader.get_region_seq("chrC", 0, 10, refSeq), blt_exception);

  // region past the contig end:
  BOOST_REQUIRE_THROW(reader.get_region_seq("chrB", 90, 110, refSeq), blt_exception);
}

BOOST_AUTO_TEST_SUITE_END()
