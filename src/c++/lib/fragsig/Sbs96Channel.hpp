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
/// \brief The 96 pyrimidine-reference trinucleotide substitution channels
///

#pragma once

#include <iosfwd>
#include <string>

/// The six pyrimidine-reference substitution types, in canonical spectrum order
namespace MUTATION_TYPE {
enum index_t { C_A, C_G, C_T, T_A, T_C, T_G, SIZE };

inline const char* label(const index_t idx)
{
  switch (idx) {
  case C_A:
    return "C>A";
  case C_G:
    return "C>G";
  case C_T:
    return "C>T";
  case T_A:
    return "T>A";
  case T_C:
    return "T>C";
  case T_G:
    return "T>G";
  default:
    return "UNKNOWN";
  }
}

/// \return false if ref/alt do not form a pyrimidine-reference substitution
bool getMutationType(const char refBase, const char altBase, index_t& idx);

/// reference and alternate base of \p idx
void getBases(const index_t idx, char& refBase, char& altBase);
}  // namespace MUTATION_TYPE

/// \brief One SBS96 channel: a pyrimidine-reference substitution with its flanking bases
///
struct Sbs96Channel {
  enum { SIZE = (MUTATION_TYPE::SIZE * 16) };

  Sbs96Channel() = default;

  Sbs96Channel(const char initFive, const char initRef, const char initAlt, const char initThree)
    : fivePrimeBase(initFive), refBase(initRef), altBase(initAlt), threePrimeBase(initThree)
  {
  }

  /// \brief Channel from its index in canonical order
  ///
  /// Canonical order is mutation type major, then 5' base, then 3' base, flanks in ACGT order.
  static Sbs96Channel fromIndex(const unsigned index);

  /// \return index in canonical order
  unsigned index() const;

  /// "<5' base>[<ref>><alt>]<3' base>"
  std::string label() const;

  bool operator==(const Sbs96Channel& rhs) const
  {
    return ((fivePrimeBase == rhs.fivePrimeBase) && (refBase == rhs.refBase) && (altBase == rhs.altBase) &&
            (threePrimeBase == rhs.threePrimeBase));
  }

  char fivePrimeBase  = 'N';
  char refBase        = 'N';
  char altBase        = 'N';
  char threePrimeBase = 'N';
};

std::ostream& operator<<(std::ostream& os, const Sbs96Channel& channel);
