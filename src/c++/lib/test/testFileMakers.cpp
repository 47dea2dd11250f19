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

#include "testFileMakers.hpp"

#include "boost/filesystem.hpp"

TestFileMakerBase::TestFileMakerBase(const std::string& suffix)
{
  using namespace boost::filesystem;

  const path tempDir(temp_directory_path());
  do {
    _tempFilename = (tempDir / unique_path("pileup-%%%%-%%%%-%%%%")).string() + suffix;
  } while (exists(_tempFilename));
}

TestFileMakerBase::~TestFileMakerBase()
{
  removeCompanionFile("");
}

void TestFileMakerBase::removeCompanionFile(const std::string& suffix) const
{
  using namespace boost::filesystem;
  const std::string filename(_tempFilename + suffix);
  if (exists(filename)) {
    remove(filename);
  }
}

TestFilenameMaker::TestFilenameMaker() : TestFileMakerBase("") {}

BamFilenameMaker::BamFilenameMaker() : TestFileMakerBase(".bam") {}

BamFilenameMaker::~BamFilenameMaker()
{
  removeCompanionFile(".bai");
}

FastaFilenameMaker::FastaFilenameMaker() : TestFileMakerBase(".fa") {}

FastaFilenameMaker::~FastaFilenameMaker()
{
  removeCompanionFile(".fai");
}
