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
/// \brief Per-locus fragment support categories and their counts
///

#pragma once

#include "fragsig/LocusStatus.hpp"

#include <array>
#include <string>

/// Fragment support categories tallied at each locus, in consensus table column order
namespace SUPPORT_TYPE {
enum index_t { CO_MUT, SO_MUT, CO_REF, SO_REF, DO, SO_OTHER, CO_OTHER, SIZE };

inline const char* label(const index_t idx)
{
  switch (idx) {
  case CO_MUT:
    return "CO_MUT";
  case SO_MUT:
    return "SO_MUT";
  case CO_REF:
    return "CO_REF";
  case SO_REF:
    return "SO_REF";
  case DO:
    return "DO";
  case SO_OTHER:
    return "SO_OTHER";
  case CO_OTHER:
    return "CO_OTHER";
  default:
    return "UNKNOWN";
  }
}

/// \return false if \p str is not a category label
bool parseLabel(const std::string& str, index_t& idx);

/// \brief Map a fragment-locus status to its support category
///
/// \return false for statuses without a support category (outer fragments)
bool getSupportType(const LOCUS_STATUS::index_t status, index_t& idx);
}  // namespace SUPPORT_TYPE

/// \brief Fragment counts and median fragment lengths for each support category at one locus
///
struct SupportTally {
  SupportTally() { clear(); }

  void clear();

  unsigned total() const;

  bool hasMedianLength(const SUPPORT_TYPE::index_t idx) const { return (counts[idx] > 0); }

  std::array<unsigned, SUPPORT_TYPE::SIZE> counts;

  /// median fragment length per category, only defined where hasMedianLength() is true
  std::array<double, SUPPORT_TYPE::SIZE> medianLength;
};
