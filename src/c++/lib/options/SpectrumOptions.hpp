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

#pragma once

#include <string>
#include <vector>

/// \brief Parameters of the SBS96 spectrum tabulation
///
struct SpectrumOptions {
  /// Report each count as a fraction of the total count over all channels and strata
  bool isNormalizeCounts = false;

  /// Report each count as a fraction of the total count over all channels of its own stratum, takes
  /// precedence over isNormalizeCounts
  bool isNormalizeCountsPerStratum = false;

  /// Support tally category labels, a consensus record with support in any of these is not counted
  std::vector<std::string> excludeIfTypePresent;

  /// Support tally category labels, when given a consensus record is only counted with support in one
  /// of these
  std::vector<std::string> retainIfTypePresent;
};
