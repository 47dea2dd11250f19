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

#include "common/Program.hpp"

#include "blt_util/blt_exception.hpp"
#include "common/Exceptions.hpp"
#include "common/config.h"
#include "pileup/GenomeIntervalUtil.hpp"

#include <cstdlib>
#include <iostream>

namespace pileup {

void writeBuildInfo(std::ostream& os)
{
  os << "version:\t" << PILEUP_VERSION << "\n";
  os << "buildTime:\t" << PILEUP_BUILD_TIME << "\n";
  os << "compiler:\t" << PILEUP_CXX_COMPILER_NAME << "-" << PILEUP_COMPILER_VERSION << "\n";
}

void Program::reportFailure(int argc, char* argv[], std::ostream& os) const
{
  os << "cmdline:\t";
  for (int argIndex(0); argIndex < argc; ++argIndex) {
    if (argIndex > 0) os << ' ';
    os << argv[argIndex];
  }
  os << "\n";
  if (_region) os << "region:\t" << getSamtoolsRegionString(*_region) << "\n";
  writeBuildInfo(os);
  os << std::flush;
}

int Program::run(int argc, char* argv[], std::ostream& errorStream)
{
  try {
    std::ios_base::sync_with_stdio(false);

    runInternal(argc, argv);
    return EXIT_SUCCESS;
  } catch (const blt_exception& e) {
    errorStream << "FATAL_ERROR: " << name() << ": " << e.what() << "\n";
  } catch (const common::ExceptionData& e) {
    // the context already holds the exception message
    errorStream << "FATAL_ERROR: " << name() << ": " << e.getContext() << "\n";
  } catch (const boost::exception& e) {
    errorStream << "FATAL_ERROR: " << name() << ": " << boost::diagnostic_information(e) << "\n";
  } catch (const std::exception& e) {
    errorStream << "FATAL_ERROR: " << name() << ": " << e.what() << "\n";
  }
  reportFailure(argc, argv, errorStream);
  return EXIT_FAILURE;
}

}  // namespace pileup
