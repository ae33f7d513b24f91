//
// FragSig - cfDNA Fragment Mutation Signature Caller
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

#include "CEMOptions.hpp"

#include "blt_util/log.hpp"
#include "common/ProgramUtil.hpp"
#include "options/EndMotifOptionsParser.hpp"
#include "options/FragmentInputOptionsParser.hpp"
#include "options/optionsUtil.hpp"

#include "boost/program_options.hpp"

#include <iostream>

void parseCEMOptions(const fragsig::Program& prog, int argc, char* argv[], CEMOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description req("configuration");
  // clang-format off
  req.add_options()
  ("ref", po::value(&opt.referenceFilename),
   "fasta reference sequence (required)")
  ("output", po::value(&opt.outputFilename),
   "write fragment end motif profile to filename (required)")
  ;
  // clang-format on

  po::options_description inputDesc(getOptionsDescription(opt.inputOpt));
  po::options_description motifDesc(getOptionsDescription(opt.motifOpt));

  po::options_description help("help");
  help.add_options()("help,h", "print this message");

  po::options_description visible("options");
  visible.add(inputDesc).add(req).add(motifDesc).add(help);

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
  if (parseOptions(vm, opt.inputOpt, errorMsg) || parseOptions(vm, opt.motifOpt, errorMsg) ||
      checkAndStandardizeRequiredInputFilePath(opt.referenceFilename, "reference fasta", errorMsg) ||
      checkRequiredOutputFilePath(opt.outputFilename, "end motif profile output", errorMsg)) {
    usage(log_os, prog, visible, errorMsg.c_str());
  }
}
