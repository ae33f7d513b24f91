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

#include "fragsig/FragmentStore.hpp"

#include <cassert>
#include <cctype>

std::string getLogicalFragmentId(const std::string& fragmentId)
{
  const std::string::size_type dotPos(fragmentId.rfind('.'));
  if ((dotPos == std::string::npos) || ((dotPos + 1) == fragmentId.size())) return fragmentId;

  for (std::string::size_type i(dotPos + 1); i < fragmentId.size(); ++i) {
    if (!isdigit(static_cast<unsigned char>(fragmentId[i]))) return fragmentId;
  }
  return fragmentId.substr(0, dotPos);
}

unsigned FragmentStore::addFragment(
    const std::string& fragmentId,
    const std::string& chrom,
    const pos_t        beginPos,
    const pos_t        endPos,
    const char         strand,
    bool&              isNew)
{
  const auto insertVal(_idIndex.insert(std::make_pair(fragmentId, static_cast<unsigned>(_fragments.size()))));
  isNew = insertVal.second;
  if (isNew) {
    Fragment fragment;
    fragment.fragmentId = fragmentId;
    fragment.chrom      = chrom;
    fragment.beginPos   = beginPos;
    fragment.endPos     = endPos;
    fragment.strand     = strand;
    _fragments.push_back(fragment);
  }
  return insertVal.first->second;
}

void FragmentStore::addAnnotation(const unsigned fragmentIndex, const LocusAnnotation& annotation)
{
  assert(fragmentIndex < _fragments.size());
  _fragments[fragmentIndex].annotations.push_back(annotation);
}
