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

#include "fragsig/Sbs96Channel.hpp"

#include "blt_util/seq_util.hpp"

#include <cassert>
#include <iostream>

namespace MUTATION_TYPE {

static const char typeBases[SIZE][2] = {
    {'C', 'A'}, {'C', 'G'}, {'C', 'T'}, {'T', 'A'}, {'T', 'C'}, {'T', 'G'}};

bool getMutationType(const char refBase, const char altBase, index_t& idx)
{
  for (int i(0); i < SIZE; ++i) {
    if ((typeBases[i][0] == refBase) && (typeBases[i][1] == altBase)) {
      idx = static_cast<index_t>(i);
      return true;
    }
  }
  return false;
}

void getBases(const index_t idx, char& refBase, char& altBase)
{
  assert((idx >= 0) && (idx < SIZE));
  refBase = typeBases[idx][0];
  altBase = typeBases[idx][1];
}

}  // namespace MUTATION_TYPE

Sbs96Channel Sbs96Channel::fromIndex(const unsigned index)
{
  assert(index < SIZE);

  Sbs96Channel channel;
  MUTATION_TYPE::getBases(static_cast<MUTATION_TYPE::index_t>(index / 16), channel.refBase, channel.altBase);
  channel.fivePrimeBase  = id_to_base((index % 16) / N_BASE);
  channel.threePrimeBase = id_to_base(index % N_BASE);
  return channel;
}

unsigned Sbs96Channel::index() const
{
  MUTATION_TYPE::index_t mutationType;
  const bool             isValid(MUTATION_TYPE::getMutationType(refBase, altBase, mutationType));
  assert(isValid);
  (void)isValid;

  return ((mutationType * 16) + (base_to_id(fivePrimeBase) * N_BASE) + base_to_id(threePrimeBase));
}

std::string Sbs96Channel::label() const
{
  std::string result;
  result += fivePrimeBase;
  result += '[';
  result += refBase;
  result += '>';
  result += altBase;
  result += ']';
  result += threePrimeBase;
  return result;
}

std::ostream& operator<<(std::ostream& os, const Sbs96Channel& channel)
{
  os << channel.label();
  return os;
}
