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
/// \brief Reference sequence motifs at cfDNA fragment ends
///

#pragma once

#include "fragsig/FragmentStore.hpp"
#include "fragsig/LocusFragmentJoiner.hpp"
#include "fragsig/ReferenceAccessor.hpp"
#include "fragsig/StatusResolver.hpp"
#include "options/EndMotifOptions.hpp"

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

/// \brief Every [ACGT] motif of length \p motifLength in lexicographic order
///
void getAllMotifs(const unsigned motifLength, std::vector<std::string>& motifs);

/// \brief Fetch the reference motifs at the ends of one fragment
///
/// Each motif is read 5' to 3' from a fragment end into the fragment. The start motif is the first
/// \p motifLength bases of the fragment on its own strand. The end motif is the first \p motifLength
/// bases from the opposite end on the opposite strand, so it is reverse-complemented. Fragments with
/// strand '*' are read as forward strand fragments.
///
/// Motifs of fragments shorter than \p motifLength extend past the opposite fragment end. Motifs clipped
/// by either chromosome end are returned short.
///
/// \param[out] motifs start motif first when both ends are requested
void getFragmentEndMotifs(
    const ReferenceAccessor&    reference,
    const Fragment&             fragment,
    const FRAGMENT_END::index_t motifType,
    const unsigned              motifLength,
    std::vector<std::string>&   motifs);

struct EndMotifEntry {
  std::string motif;
  unsigned    count    = 0;
  double      fraction = 0;
};

/// \brief Accumulates end motif counts for one fragment set
///
/// Motifs with a base outside [ACGT], or with the wrong length, are set aside as ambiguous and never
/// enter the profile.
class EndMotifCounter {
public:
  explicit EndMotifCounter(const unsigned motifLength);

  unsigned getMotifLength() const { return _motifLength; }

  void addMotif(const std::string& motif);

  /// total of all unambiguous motif counts
  unsigned totalCount() const { return _totalCount; }

  unsigned getCount(const std::string& motif) const;

  const std::map<std::string, unsigned>& getAmbiguousMotifCounts() const { return _ambiguousCounts; }

  /// \brief Profile every possible motif in lexicographic order
  ///
  /// Motifs never observed are included with a count of 0. Fractions are over totalCount(), and are 0
  /// when nothing was counted.
  ///
  /// \param[out] missingMotifs motifs never observed
  void getProfile(std::vector<EndMotifEntry>& profile, std::vector<std::string>& missingMotifs) const;

private:
  unsigned getMotifIndex(const std::string& motif) const;

  unsigned                        _motifLength;
  std::vector<unsigned>           _counts;
  unsigned                        _totalCount = 0;
  std::map<std::string, unsigned> _ambiguousCounts;
};

/// \brief Count the end motifs of every retained fragment once
///
/// \param[in] rows joined rows, a fragment spanning several loci is counted once
void getEndMotifCounts(
    const std::vector<FragmentLocusRow>& rows,
    const ReferenceAccessor&             reference,
    const EndMotifOptions&               opt,
    EndMotifCounter&                     counter);

/// \brief Count the end motifs of reference-supporting and mutant-supporting fragment-locus pairs
///
/// Reference pairs have REF:concordant or REF:single_read status, mutant pairs MUT:concordant or
/// MUT:single_read. A fragment is counted once for each pair, as in the length comparison.
void getEndMotifComparisonCounts(
    const std::vector<ResolvedFragmentLocus>& rows,
    const ReferenceAccessor&                  reference,
    const EndMotifOptions&                    opt,
    EndMotifCounter&                          refCounter,
    EndMotifCounter&                          mutCounter);

void writeEndMotifProfile(std::ostream& os, const std::vector<EndMotifEntry>& profile);

/// \param[in] refProfile,mutProfile profiles of the same motif length
void writeEndMotifComparison(
    std::ostream&                     os,
    const std::vector<EndMotifEntry>& refProfile,
    const std::vector<EndMotifEntry>& mutProfile);
