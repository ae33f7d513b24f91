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
/// \brief Audit counts of records skipped or flagged during a run
///

#pragma once

#include <iosfwd>

/// \brief Per-run audit counters
///
/// No per-record condition is fatal to a run. Each skipped or flagged record is counted here so that
/// the caller can audit the run. Counters from concurrent locus shards are combined with merge().
struct RunStats {
  void merge(const RunStats& rhs);

  /// write all counters as "key<TAB>value" lines
  void report(std::ostream& os) const;

  /// write report() output to \p filename
  void save(const char* filename) const;

  /// number of loci in the input locus table
  unsigned locusCount = 0;

  /// locus table rows ignored because their locus key was already present
  unsigned duplicateLocusCount = 0;

  /// fragments retained after identifier de-duplication
  unsigned fragmentCount = 0;

  /// fragments dropped because an earlier fragment had the same logical identifier
  unsigned duplicateFragmentCount = 0;

  /// repeated annotations of the same locus on one fragment
  unsigned duplicateAnnotationCount = 0;

  /// retained fragments which overlap no target locus
  unsigned outerFragmentCount = 0;

  /// fragment-locus pairs produced by the join
  unsigned fragmentLocusPairCount = 0;

  /// fragment-locus pairs whose locus is absent from the locus table
  unsigned unresolvedLocusCount = 0;

  /// fragment-locus pairs where the upstream status label disagrees with the resolved status
  unsigned statusConflictCount = 0;

  /// loci with no qualifying fragment, these are not emitted
  unsigned noSupportLocusCount = 0;

  /// loci with a finalized consensus mismatch
  unsigned consensusRecordCount = 0;

  /// consensus records excluded from the spectrum for a non-ACGT trinucleotide window or consensus base
  unsigned ambiguousBaseCount = 0;

  /// consensus records excluded from the spectrum because the consensus base matches the reference
  unsigned nonSubstitutionCount = 0;

  /// consensus records where the reference window center differs from the locus reference base
  unsigned referenceMismatchCount = 0;

  /// consensus records removed by the spectrum stratum filters
  unsigned spectrumFilteredCount = 0;

  /// consensus records counted in the spectrum
  unsigned spectrumRecordCount = 0;
};
