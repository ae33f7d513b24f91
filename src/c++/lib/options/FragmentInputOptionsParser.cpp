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

#include "options/FragmentInputOptionsParser.hpp"
#include "options/optionsUtil.hpp"

boost::program_options::options_description getOptionsDescription(FragmentInputOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description desc("fragment-input");
  // clang-format off
  desc.add_options()
  ("fragments", po::value(&opt.fragmentFilename),
   "fragment table, one tab-delimited row per fragment locus annotation (required)")
  ("loci", po::value(&opt.locusFilename),
   "candidate mutation locus table, tab-delimited chrom, pos, ref and alt columns (required)")
  ;
  // clang-format on

  return desc;
}

bool parseOptions(
    const boost::program_options::variables_map& /*vm*/, FragmentInputOptions& opt, std::string& errorMsg)
{
  if (checkAndStandardizeRequiredInputFilePath(opt.fragmentFilename, "fragment table", errorMsg)) return true;
  if (checkAndStandardizeRequiredInputFilePath(opt.locusFilename, "locus table", errorMsg)) return true;
  return false;
}
