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

#include "options/EndMotifOptionsParser.hpp"

#include <sstream>

namespace FRAGMENT_END {

bool parseLabel(const std::string& str, index_t& idx)
{
  for (int i(0); i < SIZE; ++i) {
    const index_t testIdx(static_cast<index_t>(i));
    if (str == label(testIdx)) {
      idx = testIdx;
      return true;
    }
  }
  return false;
}

}  // namespace FRAGMENT_END

boost::program_options::options_description getOptionsDescription(EndMotifOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description desc("end-motif");
  // clang-format off
  desc.add_options()
  ("motif-type", po::value<std::string>()->default_value(FRAGMENT_END::label(opt.motifType)),
   "Fragment ends to profile: s (5' start), e (3' end) or b (both)")
  ("motif-length", po::value(&opt.motifLength)->default_value(opt.motifLength),
   "Number of bases in each end motif")
  ("integrate-mut", po::value(&opt.isIntegrateMutant)->zero_tokens(),
   "Compare reference-supporting against mutant-supporting fragments")
  ;
  // clang-format on

  return desc;
}

bool parseOptions(
    const boost::program_options::variables_map& vm, EndMotifOptions& opt, std::string& errorMsg)
{
  errorMsg.clear();

  if (vm.count("motif-type")) {
    const std::string typeLabel(vm["motif-type"].as<std::string>());
    if (!FRAGMENT_END::parseLabel(typeLabel, opt.motifType)) {
      std::ostringstream oss;
      oss << "Unknown motif type '" << typeLabel << "'";
      errorMsg = oss.str();
      return true;
    }
  }

  if ((opt.motifLength < 1) || (opt.motifLength > EndMotifOptions::MAX_MOTIF_LENGTH)) {
    std::ostringstream oss;
    oss << "motif-length must be in the range [1," << EndMotifOptions::MAX_MOTIF_LENGTH << "]";
    errorMsg = oss.str();
  }

  return (!errorMsg.empty());
}
