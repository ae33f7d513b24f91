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

#include "options/SpectrumOptionsParser.hpp"

#include "blt_util/string_util.hpp"

#include <sstream>

typedef std::vector<std::string> labels_t;

/// expand any comma-separated argument values into individual labels
static void parseLabelList(const labels_t& values, labels_t& labels)
{
  labels.clear();
  labels_t valueLabels;
  for (const std::string& value : values) {
    split_string(value, ',', valueLabels, true);
    labels.insert(labels.end(), valueLabels.begin(), valueLabels.end());
  }
}

boost::program_options::options_description getOptionsDescription(SpectrumOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description desc("spectrum");
  // clang-format off
  desc.add_options()
  ("normalize-counts", po::value(&opt.isNormalizeCounts)->zero_tokens(),
   "Report spectrum values as fractions of the total count over all channels and overlap types")
  ("normalize-counts-per-stratum", po::value(&opt.isNormalizeCountsPerStratum)->zero_tokens(),
   "Report spectrum values as fractions of the total count over all channels of the same overlap type")
  ("exclude-if-type-present", po::value<labels_t>(),
   "Leave a locus out of the spectrum if it has support of this category. Accepts a comma-separated list "
   "and may be specified multiple times")
  ("retain-if-type-present", po::value<labels_t>(),
   "Only count a locus in the spectrum if it has support of this category. Accepts a comma-separated list "
   "and may be specified multiple times")
  ;
  // clang-format on

  return desc;
}

bool parseOptions(
    const boost::program_options::variables_map& vm, SpectrumOptions& opt, std::string& errorMsg)
{
  errorMsg.clear();

  if (vm.count("exclude-if-type-present")) {
    parseLabelList(
        boost::any_cast<labels_t>(vm["exclude-if-type-present"].value()), opt.excludeIfTypePresent);
  }
  if (vm.count("retain-if-type-present")) {
    parseLabelList(
        boost::any_cast<labels_t>(vm["retain-if-type-present"].value()), opt.retainIfTypePresent);
  }

  if (opt.isNormalizeCounts && opt.isNormalizeCountsPerStratum) {
    errorMsg = "Only one of normalize-counts and normalize-counts-per-stratum may be specified";
    return true;
  }

  for (const std::string& label : opt.excludeIfTypePresent) {
    for (const std::string& label2 : opt.retainIfTypePresent) {
      if (label == label2) {
        std::ostringstream oss;
        oss << "Category '" << label << "' can't be both excluded and retained";
        errorMsg = oss.str();
        return true;
      }
    }
  }

  return false;
}
