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

#include "DumpPileupOptions.hpp"

#include "blt_util/log.hpp"
#include "common/Exceptions.hpp"
#include "common/ProgramUtil.hpp"
#include "pileup/GenomeIntervalUtil.hpp"

namespace {
const char regionKey[] = "region";
}

static void usage(
    std::ostream&                                      os,
    const pileup::Program&                             prog,
    const boost::program_options::options_description& visible,
    const char*                                        msg = nullptr)
{
  usage(os, prog, visible, "write the pileup of one genome region as text records", " [ > output ]", msg);
}

boost::program_options::options_description getOptionsDescription(DumpPileupOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description optdesc("configuration");
  // clang-format off
  optdesc.add_options()
  ("ref", po::value(&opt.referenceFilename),
   "indexed fasta reference sequence (required)")
  ("align-file", po::value(&opt.alignmentFilename),
   "indexed alignment file in BAM or CRAM format (required)")
  (regionKey, po::value(&opt.region),
   "region to pile up, in samtools format, eg. 'chr17:7500735-7500795' (required)")
  ("output-file", po::value(&opt.outputFilename),
   "write pileup records to filename (default: stdout)")
  ("contained-only", po::bool_switch(&opt.isContainedOnly),
   "only include alignments which are fully contained in the region")
  ;
  // clang-format on
  return optdesc;
}

bool parseOptions(const boost::program_options::variables_map& vm, DumpPileupOptions& opt, std::string& errorMsg)
{
  if (checkAndStandardizeRequiredInputFilePath(opt.referenceFilename, "reference fasta", errorMsg)) return true;
  if (checkAndStandardizeRequiredInputFilePath(opt.alignmentFilename, "alignment", errorMsg)) return true;

  if (!vm.count(regionKey)) {
    errorMsg = "Must specify a region";
  } else {
    try {
      convertSamtoolsRegionToGenomeInterval(opt.region);
    } catch (const pileup::common::InvalidParameterException& e) {
      errorMsg = e.getMessage();
    }
  }
  return (!errorMsg.empty());
}

void parseDumpPileupOptions(const pileup::Program& prog, int argc, char* argv[], DumpPileupOptions& opt)
{
  namespace po = boost::program_options;
  const po::options_description req(getOptionsDescription(opt));

  po::options_description help("help");
  help.add_options()("help,h", "print this message");

  po::options_description visible("options");
  visible.add(req).add(help);

  bool              po_parse_fail(false);
  po::variables_map vm;
  try {
    po::store(
        po::parse_command_line(
            argc, argv, visible, po::command_line_style::unix_style ^ po::command_line_style::allow_short),
        vm);
    po::notify(vm);
  } catch (const boost::program_options::error& e) {
    log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
    po_parse_fail = true;
  }

  if ((argc <= 1) || (vm.count("help")) || po_parse_fail) {
    usage(log_os, prog, visible);
  }

  std::string errorMsg;
  if (parseOptions(vm, opt, errorMsg)) {
    usage(log_os, prog, visible, errorMsg.c_str());
  }
}
