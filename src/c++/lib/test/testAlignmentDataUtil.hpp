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
/// \brief Build small indexed reference and alignment files for unit testing
///

#pragma once

#include "htsapi/bam_record.hpp"

#include <string>
#include <vector>

/// contig name and sequence, used for both the test reference and the test alignment header
struct TestContig {
  TestContig(const std::string& initName, const std::string& initBases) : name(initName), bases(initBases) {}

  std::string name;
  std::string bases;
};

struct HtslibBamHeaderManager {
  /// \brief Initialize a bam header object with chromosome name, size and order as specified by \p contigs
  explicit HtslibBamHeaderManager(const std::vector<TestContig>& contigs = {});

  ~HtslibBamHeaderManager();

  bam_hdr_t& get() { return *_header; }

private:
  bam_hdr_t* _header;
};

/// \brief Format one SAM text record with no mate, quality or tags
///
/// \param[in] pos one-indexed alignment position
std::string getTestSamLine(
    const std::string& qname,
    const int          flag,
    const std::string& contig,
    const int          pos,
    const std::string& cigarString,
    const std::string& querySeq);

/// \brief Parse one SAM text record into \p bamRead
void buildTestBamRecord(bam_hdr_t& header, const std::string& samLine, bam_record& bamRead);

/// \brief Write SAM text records to a new indexed BAM file
///
/// \param[in] samLines records, in coordinate sorted order
void buildTestBamFile(
    const std::vector<TestContig>& contigs,
    const std::vector<std::string>& samLines,
    const std::string&              bamFilename);

/// \brief Write contigs to a new indexed FASTA file
void buildTestFastaFile(const std::vector<TestContig>& contigs, const std::string& fastaFilename);

/// \brief Contigs of the standard test files: chrA with 200 bases and chrB with 100 bases
const std::vector<TestContig>& getTestContigs();

/// \brief Records of the standard test alignment file, on the contigs of getTestContigs()
///
/// chrA holds, in order:
/// - read1/1 at 10, 10M
/// - read2/1 at 50, 5S10M
/// - read2/1 supplementary at 100, 10M
/// - pair1/2 at 120, 10M
/// - noseq/1 at 150, 10M, with no stored read sequence
/// - unplaced/1 at 160, unmapped
///
/// chrB holds readB/1 at 0, 10M. All positions are zero-indexed, and every read sequence matches the
/// reference.
std::vector<std::string> getTestSamLines();
