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

/// Fragment length profile comparison modes
namespace LENGTH_PROFILE_MODE {
enum index_t { DEFAULT, MUT_VS_REF, MUT_VS_OUTER, MUT_VS_REF_NORM, MUT_VS_OUTER_NORM, SIZE };

inline const char* label(const index_t idx)
{
  switch (idx) {
  case DEFAULT:
    return "default";
  case MUT_VS_REF:
    return "mut_vs_ref";
  case MUT_VS_OUTER:
    return "mut_vs_outer";
  case MUT_VS_REF_NORM:
    return "mut_vs_ref_norm";
  case MUT_VS_OUTER_NORM:
    return "mut_vs_outer_norm";
  default:
    return "UNKNOWN";
  }
}

/// true if the comparison set is down-sampled to the mutant set size
inline bool isNormalized(const index_t idx)
{
  return ((idx == MUT_VS_REF_NORM) || (idx == MUT_VS_OUTER_NORM));
}

/// true if mutant fragments are compared against reference fragments
inline bool isReferenceComparison(const index_t idx)
{
  return ((idx == MUT_VS_REF) || (idx == MUT_VS_REF_NORM));
}

/// \return false if \p str is not a mode label
bool parseLabel(const std::string& str, index_t& idx);
}  // namespace LENGTH_PROFILE_MODE

/// \brief Parameters of the fragment length profile
///
struct LengthProfileOptions {
  LENGTH_PROFILE_MODE::index_t mode = LENGTH_PROFILE_MODE::DEFAULT;

  /// Fragment length range of the default mode histogram
  unsigned minFragmentLength = 1;
  unsigned maxFragmentLength = 1000;

  /// Seeds comparison set down-sampling
  unsigned deterministicSeed = 123;
};
