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

#include "fragsig/ConsensusSelector.hpp"

#include "blt_util/random_util.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <sstream>

std::string LocusConsensus::getConsensusMismatch() const
{
  assert(state >= CONSENSUS_STATE::BASE_DISAMBIGUATED);

  std::ostringstream oss;
  oss << locus.key << ':' << consensusBase << ':' << SUPPORT_TYPE::label(category);
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const LocusConsensus& consensus)
{
  os << "LocusConsensus: " << consensus.locus.getTargetKey()
     << " state: " << CONSENSUS_STATE::label(consensus.state);
  if (consensus.state >= CONSENSUS_STATE::CATEGORY_SELECTED) {
    os << " category: " << SUPPORT_TYPE::label(consensus.category) << " fragment: " << consensus.fragmentId
       << " mateBases: " << consensus.mateBases;
  }
  if (consensus.state >= CONSENSUS_STATE::BASE_DISAMBIGUATED) {
    os << " base: " << consensus.consensusBase;
  }
  return os;
}

static double getMedian(std::vector<pos_t>& lengths)
{
  assert(!lengths.empty());

  std::sort(lengths.begin(), lengths.end());
  const unsigned size(lengths.size());
  const unsigned mid(size / 2);
  if (size % 2) return lengths[mid];
  return (static_cast<double>(lengths[mid - 1]) + static_cast<double>(lengths[mid])) / 2.;
}

void computeSupportTally(const std::vector<const ResolvedFragmentLocus*>& locusRows, SupportTally& tally)
{
  tally.clear();

  std::vector<pos_t> lengths[SUPPORT_TYPE::SIZE];
  for (const ResolvedFragmentLocus* rowPtr : locusRows) {
    SUPPORT_TYPE::index_t supportType;
    if (!SUPPORT_TYPE::getSupportType(rowPtr->status, supportType)) continue;
    tally.counts[supportType]++;
    lengths[supportType].push_back(rowPtr->fragmentLength);
  }

  for (int i(0); i < SUPPORT_TYPE::SIZE; ++i) {
    if (lengths[i].empty()) continue;
    tally.medianLength[i] = getMedian(lengths[i]);
  }
}

bool selectConsensusCategory(const SupportTally& tally, std::mt19937& rng, SUPPORT_TYPE::index_t& category)
{
  using namespace SUPPORT_TYPE;

  if (tally.counts[CO_MUT] > 0) {
    category = CO_MUT;
    return true;
  }
  if (tally.counts[SO_MUT] > 0) {
    category = SO_MUT;
    return true;
  }

  static const index_t weakTypes[] = {DO, SO_OTHER, CO_OTHER};

  unsigned             maxCount(0);
  std::vector<index_t> maxTypes;
  for (const index_t supportType : weakTypes) {
    const unsigned count(tally.counts[supportType]);
    if (count == 0) continue;
    if (count > maxCount) {
      maxCount = count;
      maxTypes.clear();
    }
    if (count == maxCount) maxTypes.push_back(supportType);
  }

  if (maxTypes.empty()) return false;

  if (maxTypes.size() == 1) {
    category = maxTypes.front();
  } else {
    category = maxTypes[get_uniform_index(rng, maxTypes.size())];
  }
  return true;
}

char disambiguateConsensusBase(
    const MateBases& resolved, const char refBase, const char altBase, std::mt19937& rng)
{
  if (resolved.isConcordant()) return resolved.mate1;

  std::vector<char> candidates;
  for (const char base : {resolved.mate1, resolved.mate2}) {
    if (base == refBase) continue;
    if (std::find(candidates.begin(), candidates.end(), base) != candidates.end()) continue;
    candidates.push_back(base);
  }

  // prefer a called base over a no-call:
  if (candidates.size() == 2) {
    const auto nIter(std::find(candidates.begin(), candidates.end(), 'N'));
    if (nIter != candidates.end()) candidates.erase(nIter);
  }

  assert(!candidates.empty());
  if (candidates.size() == 1) return candidates.front();

  if (std::find(candidates.begin(), candidates.end(), altBase) != candidates.end()) return altBase;

  return candidates[get_uniform_index(rng, candidates.size())];
}

bool resolveLocusConsensus(
    const Locus&                                     locus,
    const std::vector<const ResolvedFragmentLocus*>& locusRows,
    std::mt19937&                                    rng,
    LocusConsensus&                                  consensus)
{
  consensus       = LocusConsensus();
  consensus.locus = locus;
  computeSupportTally(locusRows, consensus.tally);

  if (!selectConsensusCategory(consensus.tally, rng, consensus.category)) return false;

  std::vector<const ResolvedFragmentLocus*> categoryRows;
  for (const ResolvedFragmentLocus* rowPtr : locusRows) {
    SUPPORT_TYPE::index_t supportType;
    if (!SUPPORT_TYPE::getSupportType(rowPtr->status, supportType)) continue;
    if (supportType == consensus.category) categoryRows.push_back(rowPtr);
  }
  assert(!categoryRows.empty());

  const ResolvedFragmentLocus* selectedPtr(categoryRows.front());
  if (categoryRows.size() > 1) {
    selectedPtr = categoryRows[get_uniform_index(rng, categoryRows.size())];
  }
  consensus.fragmentId = selectedPtr->fragmentId;
  consensus.mateBases  = selectedPtr->mateBases;
  consensus.state      = CONSENSUS_STATE::CATEGORY_SELECTED;

  consensus.consensusBase = disambiguateConsensusBase(consensus.mateBases, locus.refBase, locus.altBase, rng);
  consensus.state         = CONSENSUS_STATE::BASE_DISAMBIGUATED;

  consensus.state = CONSENSUS_STATE::FINALIZED;
  return true;
}
