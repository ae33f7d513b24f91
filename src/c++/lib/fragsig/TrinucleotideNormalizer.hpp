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
/// \brief Map a finalized consensus call to its SBS96 trinucleotide channel
///

#pragma once

#include "fragsig/ConsensusSelector.hpp"
#include "fragsig/ReferenceAccessor.hpp"
#include "fragsig/Sbs96Channel.hpp"

#include <string>

/// Outcome of trinucleotide classification for one consensus record
namespace TRINUC_STATUS {
enum index_t {
  OK,
  /// the reference window or the consensus base contains a non-ACGT character
  AMBIGUOUS_BASE,
  /// the consensus base matches the reference window center
  NON_SUBSTITUTION,
  SIZE
};

inline const char* label(const index_t idx)
{
  switch (idx) {
  case OK:
    return "ok";
  case AMBIGUOUS_BASE:
    return "ambiguous_base";
  case NON_SUBSTITUTION:
    return "non_substitution";
  default:
    return "UNKNOWN";
  }
}
}  // namespace TRINUC_STATUS

/// \brief Derives the pyrimidine-reference SBS96 channel of consensus calls
///
/// The reference accessor is owned by the caller and must outlive this object.
class TrinucleotideNormalizer {
public:
  explicit TrinucleotideNormalizer(const ReferenceAccessor& reference) : _reference(reference) {}

  /// \brief Fetch the reference window centered on the consensus locus and derive its channel
  ///
  /// \param[out] isReferenceMismatch true if the window center differs from the locus reference base,
  ///                                 the fetched window still defines the channel in this case
  TRINUC_STATUS::index_t getChannel(
      const LocusConsensus& consensus, Sbs96Channel& channel, bool& isReferenceMismatch) const;

  /// \brief Normalize a reference trinucleotide and substituted center base to the pyrimidine-reference
  /// convention
  ///
  /// When the center base is a purine the trinucleotide is reverse-complemented and the substituted base
  /// is complemented.
  static TRINUC_STATUS::index_t normalizeTrinucleotide(
      const std::string& refTrinucleotide, const char mutBase, Sbs96Channel& channel);

private:
  const ReferenceAccessor& _reference;
};
