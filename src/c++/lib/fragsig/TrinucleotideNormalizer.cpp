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

#include "fragsig/TrinucleotideNormalizer.hpp"

#include "blt_util/seq_util.hpp"

#include <cassert>

TRINUC_STATUS::index_t TrinucleotideNormalizer::normalizeTrinucleotide(
    const std::string& refTrinucleotide, const char mutBase, Sbs96Channel& channel)
{
  using namespace TRINUC_STATUS;

  if (refTrinucleotide.size() != 3) return AMBIGUOUS_BASE;
  if (!(is_acgt_seq(refTrinucleotide) && is_acgt_base(mutBase))) return AMBIGUOUS_BASE;
  if (refTrinucleotide[1] == mutBase) return NON_SUBSTITUTION;

  if (is_purine_base(refTrinucleotide[1])) {
    const std::string pyrimidineTrinucleotide(reverseCompCopyStr(refTrinucleotide));
    channel = Sbs96Channel(
        pyrimidineTrinucleotide[0], pyrimidineTrinucleotide[1], comp_base(mutBase),
        pyrimidineTrinucleotide[2]);
  } else {
    channel = Sbs96Channel(refTrinucleotide[0], refTrinucleotide[1], mutBase, refTrinucleotide[2]);
  }
  return OK;
}

TRINUC_STATUS::index_t TrinucleotideNormalizer::getChannel(
    const LocusConsensus& consensus, Sbs96Channel& channel, bool& isReferenceMismatch) const
{
  assert(consensus.isFinalized());

  isReferenceMismatch = false;

  const LocusKey& key(consensus.locus.key);
  if (key.pos < 2) return TRINUC_STATUS::AMBIGUOUS_BASE;

  std::string refTrinucleotide;
  _reference.fetch(key.chrom, key.pos - 1, key.pos + 1, refTrinucleotide);
  if (refTrinucleotide.size() != 3) return TRINUC_STATUS::AMBIGUOUS_BASE;

  isReferenceMismatch = (refTrinucleotide[1] != consensus.locus.refBase);
  return normalizeTrinucleotide(refTrinucleotide, consensus.consensusBase, channel);
}
