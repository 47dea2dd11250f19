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

#include "blt_util/log.hpp"
#include "pileup/GenomeInterval.hpp"

#include "boost/optional.hpp"

#include <iosfwd>

namespace pileup {

/// write version, build time and compiler of this build, one tab-separated field per line
void writeBuildInfo(std::ostream& os);

/// \brief Base class for the command line programs
///
/// Any exception escaping runInternal is reported as FATAL_ERROR, followed by the command line, the genome
/// region being processed (if the program has set one) and the build details.
struct Program {
  virtual ~Program() = default;

  /// \param[in] errorStream destination of failure reports
  ///
  /// \return process exit status
  int run(int argc, char* argv[], std::ostream& errorStream = log_os);

  virtual const char* name() const = 0;

protected:
  virtual void runInternal(int argc, char* argv[]) = 0;

  /// record the region the program is working on, for failure reports
  void setRegion(const GenomeInterval& region) { _region = region; }

private:
  void reportFailure(int argc, char* argv[], std::ostream& os) const;

  boost::optional<GenomeInterval> _region;
};

}  // namespace pileup
