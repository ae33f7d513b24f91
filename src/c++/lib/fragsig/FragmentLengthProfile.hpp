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
/// \brief Fragment length profiles of all fragments, or of mutant against comparison fragments
///

#pragma once

#include "blt_util/blt_types.hpp"
#include "fragsig/LocusFragmentJoiner.hpp"
#include "fragsig/StatusResolver.hpp"
#include "options/LengthProfileOptions.hpp"

#include <iosfwd>
#include <random>
#include <vector>

struct LengthHistogramEntry {
  pos_t    length     = 0;
  unsigned count      = 0;
  double   proportion = 0;
};

struct LengthComparisonEntry {
  bool     isMutant       = false;
  pos_t    roundedLength  = 0;
  unsigned count          = 0;
  double   proportion     = 0;
};

/// \return \p length rounded to the nearest multiple of \p accuracy
pos_t roundLength(const pos_t length, const pos_t accuracy = 5);

/// \brief Histogram of de-duplicated fragment lengths over [minLength,maxLength]
///
/// Each fragment is counted once, however many loci it overlaps. Every length in range gets an entry,
/// including lengths with no fragment.
///
/// \param[out] missingLengths lengths in range with no fragment
void getFragmentLengthHistogram(
    const std::vector<FragmentLocusRow>& rows,
    const pos_t                          minLength,
    const pos_t                          maxLength,
    std::vector<LengthHistogramEntry>&   histogram,
    std::vector<pos_t>&                  missingLengths);

/// \brief Compare rounded lengths of mutant-supporting fragment-locus pairs against a comparison set
///
/// Mutant pairs are those with MUT:concordant or MUT:single_read status. The comparison set is the
/// reference-supporting pairs or the outer fragments, depending on \p mode. In normalized modes the
/// comparison set is down-sampled without replacement to the mutant set size.
///
/// Entries are ordered by comparison set first, then by rounded length. Proportions are over the total
/// count of both sets.
///
/// \param[in] mode any comparison mode, not LENGTH_PROFILE_MODE::DEFAULT
void getMutantLengthComparison(
    const std::vector<ResolvedFragmentLocus>& rows,
    const LENGTH_PROFILE_MODE::index_t        mode,
    std::mt19937&                             rng,
    std::vector<LengthComparisonEntry>&       comparison);

void writeLengthHistogram(std::ostream& os, const std::vector<LengthHistogramEntry>& histogram);

void writeLengthComparison(std::ostream& os, const std::vector<LengthComparisonEntry>& comparison);
