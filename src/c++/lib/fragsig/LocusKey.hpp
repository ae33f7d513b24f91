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
/// \brief Structured keys identifying a candidate mutation locus
///

#pragma once

#include "blt_util/blt_types.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

/// \brief Identifies a single genomic coordinate
///
/// Replaces the "chrom:pos" join strings of the upstream annotation with a hashable structure. Ordering
/// is by chromosome name (lexicographic) then position, which provides the stable locus iteration order
/// used for reproducible consensus calls.
struct LocusKey {
  LocusKey() = default;

  LocusKey(const std::string& initChrom, const pos_t initPos) : chrom(initChrom), pos(initPos) {}

  bool operator<(const LocusKey& rhs) const
  {
    if (chrom < rhs.chrom) return true;
    if (chrom == rhs.chrom) {
      return (pos < rhs.pos);
    }
    return false;
  }

  bool operator==(const LocusKey& rhs) const { return ((pos == rhs.pos) && (chrom == rhs.chrom)); }

  bool operator!=(const LocusKey& rhs) const { return (!(*this == rhs)); }

  std::string chrom;

  /// 1-indexed position
  pos_t pos = 0;
};

struct LocusKeyHash {
  std::size_t operator()(const LocusKey& key) const;
};

/// \brief Parse a locus key from "chrom:pos"
///
/// The final ':' delimits the position, so chromosome names containing ':' are tolerated.
///
/// \return false if \p str is not a valid locus key, \p key is undefined in this case
bool parseLocusKey(const std::string& str, LocusKey& key);

/// writes "chrom:pos"
std::ostream& operator<<(std::ostream& os, const LocusKey& key);

/// \brief Identifies a target substitution at a locus
///
struct TargetKey {
  TargetKey() = default;

  TargetKey(const LocusKey& initLocus, const char initRef, const char initAlt)
    : locus(initLocus), refBase(initRef), altBase(initAlt)
  {
  }

  bool operator<(const TargetKey& rhs) const
  {
    if (locus < rhs.locus) return true;
    if (locus == rhs.locus) {
      if (refBase < rhs.refBase) return true;
      if (refBase == rhs.refBase) return (altBase < rhs.altBase);
    }
    return false;
  }

  bool operator==(const TargetKey& rhs) const
  {
    return ((locus == rhs.locus) && (refBase == rhs.refBase) && (altBase == rhs.altBase));
  }

  LocusKey locus;
  char     refBase = 'N';
  char     altBase = 'N';
};

/// writes "chrom:pos:ref:alt"
std::ostream& operator<<(std::ostream& os, const TargetKey& key);
