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

#pragma once

#include "common/Program.hpp"

#include "boost/program_options.hpp"

#include <string>

struct DumpPileupOptions {
  std::string referenceFilename;
  std::string alignmentFilename;
  std::string region;
  std::string outputFilename;
  bool        isContainedOnly = false;
};

boost::program_options::options_description getOptionsDescription(DumpPileupOptions& opt);

/// check the input files and region after boost::program_options has filled in opt
///
/// Input file names are converted to absolute paths.
///
/// \return true and set errorMsg if the options can't be used
bool parseOptions(const boost::program_options::variables_map& vm, DumpPileupOptions& opt, std::string& errorMsg);

/// parse the DumpPileup command line
///
/// On a help request or any option error, usage is written to log_os and the program exits with status 2.
void parseDumpPileupOptions(const pileup::Program& prog, int argc, char* argv[], DumpPileupOptions& opt);
