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
/// \brief Run consensus resolution and trinucleotide classification over all loci
///

#pragma once

#include "fragsig/ConsensusSelector.hpp"
#include "fragsig/FragmentStore.hpp"
#include "fragsig/LocusTable.hpp"
#include "fragsig/ReferenceAccessor.hpp"
#include "fragsig/RunStats.hpp"
#include "fragsig/SpectrumAggregator.hpp"
#include "fragsig/StatusResolver.hpp"
#include "fragsig/TrinucleotideNormalizer.hpp"
#include "options/ConsensusOptions.hpp"

#include <atomic>
#include <memory>
#include <vector>

/// \brief Finalized consensus call of one locus with its trinucleotide classification
///
struct ConsensusRecord {
  bool hasChannel() const { return (trinucStatus == TRINUC_STATUS::OK); }

  LocusConsensus consensus;

  TRINUC_STATUS::index_t trinucStatus = TRINUC_STATUS::AMBIGUOUS_BASE;

  /// defined only when hasChannel() is true
  Sbs96Channel channel;

  bool isReferenceMismatch = false;

  /// true when the record has a channel but was removed by the spectrum filter
  bool isSpectrumFiltered = false;
};

/// \brief Drives the fragment join, status resolution, per-locus consensus and spectrum aggregation
///
/// Loci are processed in sorted locus key order and each locus draws its tie-breaks from a generator
/// seeded with (deterministicSeed, locus ordinal), so output is reproducible for any worker thread count.
///
/// The reference accessor is owned by the caller and must outlive this object.
class TrinucleotideCaller {
public:
  TrinucleotideCaller(
      const ConsensusOptions& opt, const SpectrumFilter& spectrumFilter, const ReferenceAccessor& reference);

  /// \param[out] records one record per locus with a finalized consensus, in sorted locus key order
  /// \param[out] spectrum spectrum over all records with a channel which pass the spectrum filter
  /// \param[in,out] stats audit counts are added to any existing values
  void call(
      const FragmentStore&          fragments,
      const LocusTable&             loci,
      std::vector<ConsensusRecord>& records,
      SpectrumAggregator&           spectrum,
      RunStats&                     stats) const;

private:
  struct LocusRows {
    const Locus*                              locusPtr = nullptr;
    std::vector<const ResolvedFragmentLocus*> rows;
  };

  struct ShardData {
    RunStats           stats;
    SpectrumAggregator spectrum;
  };

  void processLocusShard(
      const std::vector<LocusRows>&                  lociRows,
      const unsigned                                 beginIndex,
      const unsigned                                 endIndex,
      std::vector<std::unique_ptr<ConsensusRecord>>& recordSlots,
      ShardData&                                     shardData,
      std::atomic<bool>&                             isWorkerThreadException) const;

  void processLocus(
      const LocusRows&                  locusRows,
      const unsigned                    locusOrdinal,
      std::unique_ptr<ConsensusRecord>& recordSlot,
      ShardData&                        shardData) const;

  const ConsensusOptions&       _opt;
  const SpectrumFilter&         _spectrumFilter;
  const TrinucleotideNormalizer _normalizer;
};
