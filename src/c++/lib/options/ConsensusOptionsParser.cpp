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

#include "options/ConsensusOptionsParser.hpp"

boost::program_options::options_description getOptionsDescription(ConsensusOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description desc("consensus");
  // clang-format off
  desc.add_options()
  ("seed", po::value(&opt.deterministicSeed)->default_value(opt.deterministicSeed),
   "Random seed for consensus tie-breaks. Runs with the same seed and input are identical.")
  ("threads", po::value(&opt.workerThreadCount)->default_value(opt.workerThreadCount),
   "Number of locus shards to process concurrently")
  ("verbose", po::value(&opt.isVerbose)->zero_tokens(),
   "Log each skipped or flagged record")
  ;
  // clang-format on

  return desc;
}

bool parseOptions(
    const boost::program_options::variables_map& /*vm*/, ConsensusOptions& opt, std::string& errorMsg)
{
  errorMsg.clear();
  if (opt.workerThreadCount < 1) {
    errorMsg = "threads argument must be at least 1";
  }
  return (!errorMsg.empty());
}
