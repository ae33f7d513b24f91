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

#include "options/LengthProfileOptionsParser.hpp"

#include <sstream>

namespace LENGTH_PROFILE_MODE {

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

}  // namespace LENGTH_PROFILE_MODE

boost::program_options::options_description getOptionsDescription(LengthProfileOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description desc("length-profile");
  // clang-format off
  desc.add_options()
  ("mode", po::value<std::string>()->default_value(LENGTH_PROFILE_MODE::label(opt.mode)),
   "Profile mode: default, mut_vs_ref, mut_vs_outer, mut_vs_ref_norm or mut_vs_outer_norm")
  ("isize-min", po::value(&opt.minFragmentLength)->default_value(opt.minFragmentLength),
   "Minimum fragment length in the default mode histogram")
  ("isize-max", po::value(&opt.maxFragmentLength)->default_value(opt.maxFragmentLength),
   "Maximum fragment length in the default mode histogram")
  ("seed", po::value(&opt.deterministicSeed)->default_value(opt.deterministicSeed),
   "Random seed for comparison set down-sampling")
  ;
  // clang-format on

  return desc;
}

bool parseOptions(
    const boost::program_options::variables_map& vm, LengthProfileOptions& opt, std::string& errorMsg)
{
  errorMsg.clear();

  if (vm.count("mode")) {
    const std::string modeLabel(vm["mode"].as<std::string>());
    if (!LENGTH_PROFILE_MODE::parseLabel(modeLabel, opt.mode)) {
      std::ostringstream oss;
      oss << "Unknown length profile mode '" << modeLabel << "'";
      errorMsg = oss.str();
      return true;
    }
  }

  if (opt.minFragmentLength > opt.maxFragmentLength) {
    errorMsg = "isize-min must not exceed isize-max";
  }

  return (!errorMsg.empty());
}
