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
/// \brief Select one consensus mismatch per locus from the resolved fragment statuses
///

#pragma once

#include "fragsig/LocusTable.hpp"
#include "fragsig/StatusResolver.hpp"
#include "fragsig/SupportTally.hpp"

#include <iosfwd>
#include <random>
#include <string>
#include <vector>

/// Consensus lifecycle of a locus, transitions only move forward
namespace CONSENSUS_STATE {
enum index_t { UNRESOLVED, CATEGORY_SELECTED, BASE_DISAMBIGUATED, FINALIZED };

inline const char* label(const index_t idx)
{
  switch (idx) {
  case UNRESOLVED:
    return "unresolved";
  case CATEGORY_SELECTED:
    return "category-selected";
  case BASE_DISAMBIGUATED:
    return "base-disambiguated";
  case FINALIZED:
    return "finalized";
  default:
    return "UNKNOWN";
  }
}
}  // namespace CONSENSUS_STATE

/// \brief Consensus call for a single locus
///
struct LocusConsensus {
  bool isFinalized() const { return (state == CONSENSUS_STATE::FINALIZED); }

  /// "chrom:pos:base:CATEGORY"
  std::string getConsensusMismatch() const;

  Locus        locus;
  SupportTally tally;

  CONSENSUS_STATE::index_t state = CONSENSUS_STATE::UNRESOLVED;

  /// consensus support category, defined from CATEGORY_SELECTED onward
  SUPPORT_TYPE::index_t category = SUPPORT_TYPE::SIZE;

  /// logical identifier of the representative fragment, defined from CATEGORY_SELECTED onward
  std::string fragmentId;

  /// resolved mate bases of the representative fragment
  MateBases mateBases;

  /// defined from BASE_DISAMBIGUATED onward
  char consensusBase = 'N';
};

std::ostream& operator<<(std::ostream& os, const LocusConsensus& consensus);

/// \brief Count fragments and compute median fragment length per support category
///
/// Outer fragment rows are ignored.
void computeSupportTally(const std::vector<const ResolvedFragmentLocus*>& locusRows, SupportTally& tally);

/// \brief Choose the consensus support category for a locus
///
/// CO_MUT wins whenever present, otherwise SO_MUT wins whenever present. Without mutant support the
/// most frequent of DO, SO_OTHER and CO_OTHER is chosen, with ties broken uniformly at random.
/// Reference support never forms a consensus.
///
/// \return false if the tally has no qualifying support
bool selectConsensusCategory(const SupportTally& tally, std::mt19937& rng, SUPPORT_TYPE::index_t& category);

/// \brief Reduce the mate bases of the representative fragment to a single consensus base
///
/// Candidates are the distinct mate bases other than the reference base (and other than 'N' where any
/// called base remains). A single candidate is returned directly. With two candidates the alternate
/// base is returned if it is one of them, otherwise one candidate is chosen uniformly at random.
///
/// Calling this on a single-base observation returns that base, so the reduction is idempotent.
char disambiguateConsensusBase(
    const MateBases& resolved, const char refBase, const char altBase, std::mt19937& rng);

/// \brief Drive one locus through its consensus lifecycle
///
/// \param[in] locusRows resolved rows of this locus, in stable fragment identifier order
///
/// \return false if the locus has no qualifying fragment, in which case the consensus remains UNRESOLVED
bool resolveLocusConsensus(
    const Locus&                                     locus,
    const std::vector<const ResolvedFragmentLocus*>& locusRows,
    std::mt19937&                                    rng,
    LocusConsensus&                                  consensus);
