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
/// \brief Candidate mutation loci supplied by the upstream mismatch detection step
///

#pragma once

#include "fragsig/LocusKey.hpp"

#include <iosfwd>
#include <unordered_map>
#include <vector>

/// \brief A candidate mutation site with its known reference and alternate base
///
struct Locus {
  Locus() = default;

  Locus(const LocusKey& initKey, const char initRef, const char initAlt)
    : key(initKey), refBase(initRef), altBase(initAlt)
  {
  }

  TargetKey getTargetKey() const { return TargetKey(key, refBase, altBase); }

  LocusKey key;
  char     refBase = 'N';
  char     altBase = 'N';
};

std::ostream& operator<<(std::ostream& os, const Locus& locus);

/// \brief Hash-indexed, insertion-ordered collection of loci
///
/// Each locus key is stored once, the first locus added for a key is retained.
struct LocusTable {
  /// \return false if a locus with the same key is already present, in which case \p locus is ignored
  bool addLocus(const Locus& locus);

  /// \return nullptr if \p key is not in the table
  const Locus* findLocus(const LocusKey& key) const;

  const std::vector<Locus>& getLoci() const { return _loci; }

  unsigned size() const { return _loci.size(); }

  bool empty() const { return _loci.empty(); }

private:
  std::vector<Locus>                                  _loci;
  std::unordered_map<LocusKey, unsigned, LocusKeyHash> _index;
};
