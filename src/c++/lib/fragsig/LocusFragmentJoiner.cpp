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

#include "fragsig/LocusFragmentJoiner.hpp"

#include <unordered_set>

void joinFragmentsToLoci(
    const FragmentStore&           fragments,
    const LocusTable&              loci,
    std::vector<FragmentLocusRow>& rows,
    RunStats&                      stats)
{
  rows.clear();

  std::unordered_set<std::string> logicalIds;
  for (const Fragment& fragment : fragments.getFragments()) {
    const std::string fragmentId(getLogicalFragmentId(fragment.fragmentId));
    if (!logicalIds.insert(fragmentId).second) {
      stats.duplicateFragmentCount++;
      continue;
    }
    stats.fragmentCount++;

    FragmentLocusRow row;
    row.fragmentId     = fragmentId;
    row.fragmentLength = fragment.getLength();
    row.fragmentPtr    = &fragment;

    if (fragment.annotations.empty()) {
      stats.outerFragmentCount++;
      rows.push_back(row);
      continue;
    }

    std::unordered_set<LocusKey, LocusKeyHash> fragmentLoci;
    for (const LocusAnnotation& annotation : fragment.annotations) {
      if (!fragmentLoci.insert(annotation.locusKey).second) {
        stats.duplicateAnnotationCount++;
        continue;
      }
      row.annotationPtr = &annotation;
      row.locusPtr      = loci.findLocus(annotation.locusKey);
      stats.fragmentLocusPairCount++;
      rows.push_back(row);
    }
  }
}
