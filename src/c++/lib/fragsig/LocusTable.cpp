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

#include "fragsig/LocusTable.hpp"

#include <iostream>

std::ostream& operator<<(std::ostream& os, const Locus& locus)
{
  os << locus.getTargetKey();
  return os;
}

bool LocusTable::addLocus(const Locus& locus)
{
  const auto insertVal(_index.insert(std::make_pair(locus.key, static_cast<unsigned>(_loci.size()))));
  if (!insertVal.second) return false;
  _loci.push_back(locus);
  return true;
}

const Locus* LocusTable::findLocus(const LocusKey& key) const
{
  const auto iter(_index.find(key));
  if (iter == _index.end()) return nullptr;
  return &(_loci[iter->second]);
}
