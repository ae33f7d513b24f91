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

#include "fragsig/LocusStatus.hpp"

namespace LOCUS_STATUS {

bool parseLabel(const std::string& str, index_t& idx)
{
  for (int i(0); i < SIZE; ++i) {
    const index_t candidate(static_cast<index_t>(i));
    if (str == label(candidate)) {
      idx = candidate;
      return true;
    }
  }
  return false;
}

}  // namespace LOCUS_STATUS
