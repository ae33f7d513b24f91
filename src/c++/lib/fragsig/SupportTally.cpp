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

#include "fragsig/SupportTally.hpp"

namespace SUPPORT_TYPE {

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

bool getSupportType(const LOCUS_STATUS::index_t status, index_t& idx)
{
  using namespace LOCUS_STATUS;
  switch (status) {
  case MUT_CONCORDANT:
    idx = CO_MUT;
    return true;
  case MUT_SINGLE_READ:
    idx = SO_MUT;
    return true;
  case REF_CONCORDANT:
    idx = CO_REF;
    return true;
  case REF_SINGLE_READ:
    idx = SO_REF;
    return true;
  case MUT_DISCORDANT:
    idx = DO;
    return true;
  case OTHER_BASE_SINGLE_READ:
    idx = SO_OTHER;
    return true;
  case OTHER_BASE_CONCORDANT:
    idx = CO_OTHER;
    return true;
  default:
    return false;
  }
}

}  // namespace SUPPORT_TYPE

void SupportTally::clear()
{
  counts.fill(0);
  medianLength.fill(0.);
}

unsigned SupportTally::total() const
{
  unsigned sum(0);
  for (const unsigned count : counts) sum += count;
  return sum;
}
