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

#include "CTOptions.hpp"

#include "blt_util/log.hpp"
#include "common/ProgramUtil.hpp"
#include "fragsig/SupportTally.hpp"
#include "options/ConsensusOptionsParser.hpp"
#include "options/FragmentInputOptionsParser.hpp"
#include "options/SpectrumOptionsParser.hpp"
#include "options/optionsUtil.hpp"

#include "boost/program_options.hpp"

#include <iostream>
#include <sstream>

static bool checkSupportTypeLabels(
    const std::vector<std::string>& labels, const char* optionName, std::string& errorMsg)
{
  for (const std::string& label : labels) {
    SUPPORT_TYPE::index_t supportType;
    if (SUPPORT_TYPE::parseLabel(label, supportType)) continue;
    std::ostringstream oss;
    oss << "Unknown support category '" << label << "' for " << optionName;
    errorMsg = oss.str();
    return true;
  }
  return false;
}

/// \brief Parse CTOptions
///
/// \param[out] errorMsg If an error occurs this is set to an end-user targeted error message. Any string
/// content on input is cleared
///
/// \return True if an error occurs while parsing options
static bool parseOptions(
    const boost::program_options::variables_map& vm, CTOptions& opt, std::string& errorMsg)
{
  if (parseOptions(vm, opt.inputOpt, errorMsg)) return true;
  if (parseOptions(vm, opt.consensusOpt, errorMsg)) return true;
  if (parseOptions(vm, opt.spectrumOpt, errorMsg)) return true;

  if (checkSupportTypeLabels(opt.spectrumOpt.excludeIfTypePresent, "exclude-if-type-present", errorMsg))
    return true;
  if (checkSupportTypeLabels(opt.spectrumOpt.retainIfTypePresent, "retain-if-type-present", errorMsg))
    return true;

  if (checkAndStandardizeRequiredInputFilePath(opt.referenceFilename, "reference fasta", errorMsg))
    return true;
  if (checkRequiredOutputFilePath(opt.consensusFilename, "consensus output", errorMsg)) return true;
  if (checkRequiredOutputFilePath(opt.spectrumFilename, "spectrum output", errorMsg)) return true;

  return false;
}

void parseCTOptions(const fragsig::Program& prog, int argc, char* argv[], CTOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description req("configuration");
  // clang-format off
  req.add_options()
  ("ref", po::value(&opt.referenceFilename),
   "fasta reference sequence (required)")
  ("consensus-output", po::value(&opt.consensusFilename),
   "write per-locus consensus table to filename (required)")
  ("spectrum-output", po::value(&opt.spectrumFilename),
   "write SBS96 spectrum table to filename (required)")
  ("stats-output", po::value(&opt.statsFilename),
   "write run statistics to filename")
  ;
  // clang-format on

  po::options_description inputDesc(getOptionsDescription(opt.inputOpt));
  po::options_description consensusDesc(getOptionsDescription(opt.consensusOpt));
  po::options_description spectrumDesc(getOptionsDescription(opt.spectrumOpt));

  po::options_description help("help");
  help.add_options()("help,h", "print this message");

  po::options_description visible("options");
  visible.add(inputDesc).add(req).add(consensusDesc).add(spectrumDesc).add(help);

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
