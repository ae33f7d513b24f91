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

#include "fragsig/FragmentLengthProfile.hpp"

#include "blt_util/SampleVector.hpp"

#include <cassert>
#include <cmath>

#include <iostream>
#include <map>
#include <unordered_set>

pos_t roundLength(const pos_t length, const pos_t accuracy)
{
  assert(accuracy > 0);
  return static_cast<pos_t>(std::lround(static_cast<double>(length) / accuracy)) * accuracy;
}

void getFragmentLengthHistogram(
    const std::vector<FragmentLocusRow>& rows,
    const pos_t                          minLength,
    const pos_t                          maxLength,
    std::vector<LengthHistogramEntry>&   histogram,
    std::vector<pos_t>&                  missingLengths)
{
  assert(minLength <= maxLength);

  histogram.clear();
  missingLengths.clear();

  histogram.resize(maxLength - minLength + 1);
  for (pos_t length(minLength); length <= maxLength; ++length) {
    histogram[length - minLength].length = length;
  }

  unsigned                        total(0);
  std::unordered_set<std::string> fragmentIds;
  for (const FragmentLocusRow& row : rows) {
    if (!fragmentIds.insert(row.fragmentId).second) continue;
    if ((row.fragmentLength < minLength) || (row.fragmentLength > maxLength)) continue;
    histogram[row.fragmentLength - minLength].count++;
    total++;
  }

  for (LengthHistogramEntry& entry : histogram) {
    if (entry.count == 0) missingLengths.push_back(entry.length);
    if (total > 0) entry.proportion = static_cast<double>(entry.count) / total;
  }
}

void getMutantLengthComparison(
    const std::vector<ResolvedFragmentLocus>& rows,
    const LENGTH_PROFILE_MODE::index_t        mode,
    std::mt19937&                             rng,
    std::vector<LengthComparisonEntry>&       comparison)
{
  assert(mode != LENGTH_PROFILE_MODE::DEFAULT);

  comparison.clear();

  const bool isRefComparison(LENGTH_PROFILE_MODE::isReferenceComparison(mode));

  std::vector<pos_t> mutantLengths;
  std::vector<pos_t> otherLengths;
  for (const ResolvedFragmentLocus& row : rows) {
    if (LOCUS_STATUS::isMutant(row.status)) {
      mutantLengths.push_back(row.fragmentLength);
    } else if (isRefComparison ? LOCUS_STATUS::isReference(row.status) : row.isOuterFragment()) {
      otherLengths.push_back(row.fragmentLength);
    }
  }

  if (LENGTH_PROFILE_MODE::isNormalized(mode)) {
    SampleVector<pos_t, std::mt19937> sampledLengths(mutantLengths.size(), rng);
    sampledLengths.push(otherLengths.begin(), otherLengths.end());
    if (sampledLengths.isDownsampled()) otherLengths = sampledLengths.data();
  }

  // key is (isMutant, roundedLength):
  std::map<std::pair<bool, pos_t>, unsigned> counts;
  for (const pos_t length : otherLengths) {
    counts[std::make_pair(false, roundLength(length))]++;
  }
  for (const pos_t length : mutantLengths) {
    counts[std::make_pair(true, roundLength(length))]++;
  }

  const unsigned total(mutantLengths.size() + otherLengths.size());
  for (const auto& countVal : counts) {
    LengthComparisonEntry entry;
    entry.isMutant      = countVal.first.first;
    entry.roundedLength = countVal.first.second;
    entry.count         = countVal.second;
    entry.proportion    = static_cast<double>(entry.count) / total;
    comparison.push_back(entry);
  }
}

static const char sep('\t');

void writeLengthHistogram(std::ostream& os, const std::vector<LengthHistogramEntry>& histogram)
{
  os << "SIZE" << sep << "COUNT" << sep << "PROPORTION" << "\n";
  for (const LengthHistogramEntry& entry : histogram) {
    os << entry.length << sep << entry.count << sep << entry.proportion << "\n";
  }
}

void writeLengthComparison(std::ostream& os, const std::vector<LengthComparisonEntry>& comparison)
{
  os << "MUTANT" << sep << "SIZE_ROUNDED" << sep << "COUNT" << sep << "PROPORTION" << "\n";
  for (const LengthComparisonEntry& entry : comparison) {
    os << (entry.isMutant ? "true" : "false") << sep << entry.roundedLength << sep << entry.count << sep
       << entry.proportion << "\n";
  }
}
