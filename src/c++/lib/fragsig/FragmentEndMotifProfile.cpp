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

#include "fragsig/FragmentEndMotifProfile.hpp"

#include "blt_util/seq_util.hpp"

#include <cassert>

#include <algorithm>
#include <iostream>
#include <unordered_set>

void getAllMotifs(const unsigned motifLength, std::vector<std::string>& motifs)
{
  motifs.clear();

  unsigned motifCount(1);
  for (unsigned i(0); i < motifLength; ++i) motifCount *= N_BASE;

  motifs.reserve(motifCount);
  std::string motif(motifLength, 'A');
  for (unsigned motifIndex(0); motifIndex < motifCount; ++motifIndex) {
    unsigned val(motifIndex);
    for (unsigned i(motifLength); i > 0; --i) {
      motif[i - 1] = id_to_base(val % N_BASE);
      val /= N_BASE;
    }
    motifs.push_back(motif);
  }
}

/// fetch the closed interval, clipped at the chromosome start
static void fetchClipped(
    const ReferenceAccessor& reference,
    const std::string&       chrom,
    const pos_t              beginPos,
    const pos_t              endPos,
    std::string&             seq)
{
  seq.clear();
  if (endPos < 1) return;
  reference.fetch(chrom, std::max(beginPos, static_cast<pos_t>(1)), endPos, seq);
}

void getFragmentEndMotifs(
    const ReferenceAccessor&    reference,
    const Fragment&             fragment,
    const FRAGMENT_END::index_t motifType,
    const unsigned              motifLength,
    std::vector<std::string>&   motifs)
{
  assert(motifLength > 0);

  motifs.clear();

  const pos_t motifSpan(motifLength - 1);
  std::string leftSeq;
  std::string rightSeq;
  fetchClipped(reference, fragment.chrom, fragment.beginPos, fragment.beginPos + motifSpan, leftSeq);
  fetchClipped(reference, fragment.chrom, fragment.endPos - motifSpan, fragment.endPos, rightSeq);

  // the right end motif reads into the fragment on the reverse strand:
  rightSeq = reverseCompCopyStr(rightSeq);

  const bool   isReverse(fragment.strand == '-');
  std::string& startMotif(isReverse ? rightSeq : leftSeq);
  std::string& endMotif(isReverse ? leftSeq : rightSeq);

  if (FRAGMENT_END::isStart(motifType)) motifs.push_back(startMotif);
  if (FRAGMENT_END::isEnd(motifType)) motifs.push_back(endMotif);
}

EndMotifCounter::EndMotifCounter(const unsigned motifLength) : _motifLength(motifLength)
{
  assert(motifLength > 0);

  unsigned motifCount(1);
  for (unsigned i(0); i < motifLength; ++i) motifCount *= N_BASE;
  _counts.resize(motifCount, 0);
}

unsigned EndMotifCounter::getMotifIndex(const std::string& motif) const
{
  unsigned motifIndex(0);
  for (const char base : motif) {
    motifIndex = (motifIndex * N_BASE) + base_to_id(base);
  }
  return motifIndex;
}

void EndMotifCounter::addMotif(const std::string& motif)
{
  if ((motif.size() != _motifLength) || (!is_acgt_seq(motif))) {
    _ambiguousCounts[motif]++;
    return;
  }
  _counts[getMotifIndex(motif)]++;
  _totalCount++;
}

unsigned EndMotifCounter::getCount(const std::string& motif) const
{
  if ((motif.size() != _motifLength) || (!is_acgt_seq(motif))) return 0;
  return _counts[getMotifIndex(motif)];
}

void EndMotifCounter::getProfile(
    std::vector<EndMotifEntry>& profile, std::vector<std::string>& missingMotifs) const
{
  profile.clear();
  missingMotifs.clear();

  std::vector<std::string> motifs;
  getAllMotifs(_motifLength, motifs);

  profile.resize(motifs.size());
  for (unsigned motifIndex(0); motifIndex < motifs.size(); ++motifIndex) {
    EndMotifEntry& entry(profile[motifIndex]);
    entry.motif = motifs[motifIndex];
    entry.count = _counts[motifIndex];
    if (entry.count == 0) missingMotifs.push_back(entry.motif);
    if (_totalCount > 0) entry.fraction = static_cast<double>(entry.count) / _totalCount;
  }
}

static void addFragmentEndMotifs(
    const ReferenceAccessor& reference,
    const Fragment&          fragment,
    const EndMotifOptions&   opt,
    EndMotifCounter&         counter)
{
  std::vector<std::string> motifs;
  getFragmentEndMotifs(reference, fragment, opt.motifType, opt.motifLength, motifs);
  for (const std::string& motif : motifs) {
    counter.addMotif(motif);
  }
}

void getEndMotifCounts(
    const std::vector<FragmentLocusRow>& rows,
    const ReferenceAccessor&             reference,
    const EndMotifOptions&               opt,
    EndMotifCounter&                     counter)
{
  assert(counter.getMotifLength() == opt.motifLength);

  std::unordered_set<std::string> fragmentIds;
  for (const FragmentLocusRow& row : rows) {
    if (!fragmentIds.insert(row.fragmentId).second) continue;
    assert(row.fragmentPtr != nullptr);
    addFragmentEndMotifs(reference, *row.fragmentPtr, opt, counter);
  }
}

void getEndMotifComparisonCounts(
    const std::vector<ResolvedFragmentLocus>& rows,
    const ReferenceAccessor&                  reference,
    const EndMotifOptions&                    opt,
    EndMotifCounter&                          refCounter,
    EndMotifCounter&                          mutCounter)
{
  assert(refCounter.getMotifLength() == opt.motifLength);
  assert(mutCounter.getMotifLength() == opt.motifLength);

  for (const ResolvedFragmentLocus& row : rows) {
    if (row.isOuterFragment()) continue;
    assert(row.fragmentPtr != nullptr);
    if (LOCUS_STATUS::isReference(row.status)) {
      addFragmentEndMotifs(reference, *row.fragmentPtr, opt, refCounter);
    } else if (LOCUS_STATUS::isMutant(row.status)) {
      addFragmentEndMotifs(reference, *row.fragmentPtr, opt, mutCounter);
    }
  }
}

static const char sep('\t');

void writeEndMotifProfile(std::ostream& os, const std::vector<EndMotifEntry>& profile)
{
  os << "MOTIF" << sep << "COUNT" << sep << "FRACTION" << "\n";
  for (const EndMotifEntry& entry : profile) {
    os << entry.motif << sep << entry.count << sep << entry.fraction << "\n";
  }
}

void writeEndMotifComparison(
    std::ostream&                     os,
    const std::vector<EndMotifEntry>& refProfile,
    const std::vector<EndMotifEntry>& mutProfile)
{
  assert(refProfile.size() == mutProfile.size());

  os << "MOTIF" << sep << "COUNT_REF" << sep << "FRACTION_REF" << sep << "COUNT_MUT" << sep << "FRACTION_MUT"
     << "\n";
  for (unsigned motifIndex(0); motifIndex < refProfile.size(); ++motifIndex) {
    const EndMotifEntry& refEntry(refProfile[motifIndex]);
    const EndMotifEntry& mutEntry(mutProfile[motifIndex]);
    assert(refEntry.motif == mutEntry.motif);
    os << refEntry.motif << sep << refEntry.count << sep << refEntry.fraction << sep << mutEntry.count << sep
       << mutEntry.fraction << "\n";
  }
}
