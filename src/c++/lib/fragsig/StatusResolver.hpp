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
/// \brief Resolve mate-level base observations into a single status per fragment-locus pair
///

#pragma once

#include "blt_util/blt_types.hpp"
#include "fragsig/LocusFragmentJoiner.hpp"
#include "fragsig/LocusStatus.hpp"
#include "fragsig/RunStats.hpp"

#include <string>
#include <vector>

/// \brief Bases observed at one locus by the mates of one fragment
///
/// mate2 is '\0' when only one mate covers the locus.
struct MateBases {
  MateBases() = default;

  MateBases(const char initMate1, const char initMate2 = '\0') : mate1(initMate1), mate2(initMate2) {}

  bool isPaired() const { return (mate2 != '\0'); }

  bool isConcordant() const { return ((!isPaired()) || (mate1 == mate2)); }

  bool operator==(const MateBases& rhs) const { return ((mate1 == rhs.mate1) && (mate2 == rhs.mate2)); }

  char mate1 = 'N';
  char mate2 = '\0';
};

/// writes one character per covering mate
std::ostream& operator<<(std::ostream& os, const MateBases& mateBases);

/// placeholder used upstream for "this mate matches the reference"
const char refPlaceholderBase('R');

/// \brief Parse the raw per-mate base token of a locus annotation
///
/// Accepts one or two characters from [ACGTN] or the reference placeholder 'R', and the literal "REF"
/// for a single reference-supporting mate.
///
/// \return false if \p locusInfo is malformed
bool parseMateBases(const std::string& locusInfo, MateBases& mateBases);

/// \brief Replace reference placeholders with the known reference base
///
MateBases substituteRefPlaceholder(const MateBases& raw, const char refBase);

/// \brief Reduce a mate pair to the mates which call a base at the locus
///
/// A no-call 'N' mate does not cover the locus, so a pair with one called mate reduces to that mate
/// alone. Pairs where both mates call a base, or where both are 'N', are returned unchanged.
MateBases getCallingMates(const MateBases& mateBases);

/// \brief Classify the mate observations of one fragment at one locus
///
/// Mates are discordant only when both call a base and the bases differ. A no-call mate is ignored, so
/// "TN" at a C>T locus is a mutant single read rather than discordant support.
///
/// \param[in] resolved mate bases with no reference placeholder
LOCUS_STATUS::index_t getLocusStatus(const MateBases& resolved, const char refBase, const char altBase);

/// \brief A fragment-locus pair after status resolution
///
struct ResolvedFragmentLocus {
  bool isOuterFragment() const { return (locusPtr == nullptr); }

  /// logical fragment identifier
  std::string fragmentId;

  pos_t fragmentLength = 0;

  const Fragment* fragmentPtr = nullptr;

  /// nullptr for outer fragments
  const Locus* locusPtr = nullptr;

  /// calling mate bases with reference placeholders substituted
  MateBases mateBases;

  LOCUS_STATUS::index_t status = LOCUS_STATUS::OUTER_FRAGMENT;
};

/// \brief Resolve the status of every joined fragment-locus row
///
/// Rows whose locus is absent from the locus table cannot be resolved, they are excluded from
/// \p resolvedRows and counted as unresolved. Where an upstream status label is present and disagrees
/// with the resolved status, the resolved status is kept and the conflict is counted.
///
/// Outer fragment rows are passed through.
void resolveFragmentLoci(
    const std::vector<FragmentLocusRow>& rows,
    const bool                           isVerbose,
    std::vector<ResolvedFragmentLocus>&  resolvedRows,
    RunStats&                            stats);
