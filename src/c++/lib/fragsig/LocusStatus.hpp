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
/// \brief Per fragment-locus status categories
///

#pragma once

#include <string>

/// Status of a single fragment at a single locus. Exactly one status applies to each fragment-locus pair.
namespace LOCUS_STATUS {
enum index_t {
  REF_CONCORDANT,
  REF_SINGLE_READ,
  MUT_CONCORDANT,
  MUT_SINGLE_READ,
  MUT_DISCORDANT,
  OTHER_BASE_CONCORDANT,
  OTHER_BASE_SINGLE_READ,
  /// fragment overlaps no target locus, this marks an absence rather than a classification outcome
  OUTER_FRAGMENT,
  SIZE
};

inline const char* label(const index_t idx)
{
  switch (idx) {
  case REF_CONCORDANT:
    return "REF:concordant";
  case REF_SINGLE_READ:
    return "REF:single_read";
  case MUT_CONCORDANT:
    return "MUT:concordant";
  case MUT_SINGLE_READ:
    return "MUT:single_read";
  case MUT_DISCORDANT:
    return "MUT:discordant";
  case OTHER_BASE_CONCORDANT:
    return "other_base:concordant";
  case OTHER_BASE_SINGLE_READ:
    return "other_base:single_read";
  case OUTER_FRAGMENT:
    return "outer_fragment";
  default:
    return "UNKNOWN";
  }
}

inline bool isReference(const index_t idx)
{
  return ((idx == REF_CONCORDANT) || (idx == REF_SINGLE_READ));
}

/// true for statuses where at least one mate reports the alternate allele without mate conflict
inline bool isMutant(const index_t idx)
{
  return ((idx == MUT_CONCORDANT) || (idx == MUT_SINGLE_READ));
}

/// \brief Parse a status label as written by label()
///
/// \return false if \p str is not a status label
bool parseLabel(const std::string& str, index_t& idx);

}  // namespace LOCUS_STATUS
