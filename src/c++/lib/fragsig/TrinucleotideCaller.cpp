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

#include "fragsig/TrinucleotideCaller.hpp"

#include "blt_util/log.hpp"
#include "common/Exceptions.hpp"
#include "fragsig/LocusFragmentJoiner.hpp"

#include <cassert>
#include <cstdint>

#include <algorithm>
#include <atomic>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <random>
#include <sstream>

namespace {

/// Serializes verbose log output from worker threads:
std::mutex logMutex;

}  // namespace

TrinucleotideCaller::TrinucleotideCaller(
    const ConsensusOptions& opt, const SpectrumFilter& spectrumFilter, const ReferenceAccessor& reference)
  : _opt(opt), _spectrumFilter(spectrumFilter), _normalizer(reference)
{
}

void TrinucleotideCaller::processLocus(
    const LocusRows&                  locusRows,
    const unsigned                    locusOrdinal,
    std::unique_ptr<ConsensusRecord>& recordSlot,
    ShardData&                        shardData) const
{
  const Locus& locus(*locusRows.locusPtr);

  std::seed_seq seeds{_opt.deterministicSeed, locusOrdinal};
  std::mt19937  rng(seeds);

  std::unique_ptr<ConsensusRecord> recordPtr(new ConsensusRecord);
  ConsensusRecord&                 record(*recordPtr);
  if (!resolveLocusConsensus(locus, locusRows.rows, rng, record.consensus)) {
    shardData.stats.noSupportLocusCount++;
    return;
  }
  shardData.stats.consensusRecordCount++;

  record.trinucStatus = _normalizer.getChannel(record.consensus, record.channel, record.isReferenceMismatch);
  if (record.isReferenceMismatch) shardData.stats.referenceMismatchCount++;

  if (record.trinucStatus == TRINUC_STATUS::AMBIGUOUS_BASE) {
    shardData.stats.ambiguousBaseCount++;
  } else if (record.trinucStatus == TRINUC_STATUS::NON_SUBSTITUTION) {
    shardData.stats.nonSubstitutionCount++;
  } else {
    OVERLAP_TYPE::index_t overlapType;
    const bool isOverlapType(OVERLAP_TYPE::getOverlapType(record.consensus.category, overlapType));
    assert(isOverlapType);
    (void)isOverlapType;

    if (_spectrumFilter.isFiltered(record.consensus.tally)) {
      record.isSpectrumFiltered = true;
      shardData.stats.spectrumFilteredCount++;
    } else {
      shardData.spectrum.addRecord(record.channel, overlapType);
      shardData.stats.spectrumRecordCount++;
    }
  }

  if (_opt.isVerbose && (record.isReferenceMismatch || (!record.hasChannel()))) {
    std::lock_guard<std::mutex> lock(logMutex);
    log_os << __FUNCTION__ << ": " << record.consensus
           << " trinucleotide: " << TRINUC_STATUS::label(record.trinucStatus)
           << (record.isReferenceMismatch ? " (reference mismatch)" : "") << "\n";
  }

  recordSlot = std::move(recordPtr);
}

void TrinucleotideCaller::processLocusShard(
    const std::vector<LocusRows>&                  lociRows,
    const unsigned                                 beginIndex,
    const unsigned                                 endIndex,
    std::vector<std::unique_ptr<ConsensusRecord>>& recordSlots,
    ShardData&                                     shardData,
    std::atomic<bool>&                             isWorkerThreadException) const
{
  for (unsigned locusIndex(beginIndex); locusIndex < endIndex; ++locusIndex) {
    if (isWorkerThreadException.load()) return;

    try {
      processLocus(lociRows[locusIndex], locusIndex, recordSlots[locusIndex], shardData);
    } catch (fragsig::common::ExceptionData& e) {
      isWorkerThreadException = true;
      std::ostringstream oss;
      oss << "Exception caught while processing locus: " << lociRows[locusIndex].locusPtr->getTargetKey();
      e << boost::error_info<struct current_locus_info, std::string>(oss.str());
      throw;
    } catch (std::exception& e) {
      isWorkerThreadException = true;

      // Convert std::exception to boost exception so that we can add on more context:
      fragsig::common::GeneralException ge(e.what());

      std::ostringstream oss;
      oss << "Exception caught while processing locus: " << lociRows[locusIndex].locusPtr->getTargetKey();
      ge << boost::error_info<struct current_locus_info, std::string>(oss.str());
      BOOST_THROW_EXCEPTION(ge);
    }
  }
}

void TrinucleotideCaller::call(
    const FragmentStore&          fragments,
    const LocusTable&             loci,
    std::vector<ConsensusRecord>& records,
    SpectrumAggregator&           spectrum,
    RunStats&                     stats) const
{
  records.clear();
  spectrum.clear();

  std::vector<FragmentLocusRow> joinedRows;
  joinFragmentsToLoci(fragments, loci, joinedRows, stats);

  std::vector<ResolvedFragmentLocus> resolvedRows;
  resolveFragmentLoci(joinedRows, _opt.isVerbose, resolvedRows, stats);

  // group rows by locus in sorted locus key order:
  std::map<LocusKey, LocusRows> lociRowsMap;
  for (const ResolvedFragmentLocus& resolved : resolvedRows) {
    if (resolved.isOuterFragment()) continue;
    LocusRows& locusRows(lociRowsMap[resolved.locusPtr->key]);
    locusRows.locusPtr = resolved.locusPtr;
    locusRows.rows.push_back(&resolved);
  }

  // loci without any joined fragment never leave the unresolved state:
  stats.noSupportLocusCount += (loci.size() - lociRowsMap.size());

  std::vector<LocusRows> lociRows;
  lociRows.reserve(lociRowsMap.size());
  for (auto& locusRowsVal : lociRowsMap) {
    LocusRows& locusRows(locusRowsVal.second);
    std::stable_sort(
        locusRows.rows.begin(),
        locusRows.rows.end(),
        [](const ResolvedFragmentLocus* a, const ResolvedFragmentLocus* b) {
          return (a->fragmentId < b->fragmentId);
        });
    lociRows.push_back(std::move(locusRows));
  }

  const unsigned locusCount(lociRows.size());
  const unsigned shardCount(std::max(1u, std::min(_opt.workerThreadCount, locusCount)));

  std::vector<std::unique_ptr<ConsensusRecord>> recordSlots(locusCount);
  std::vector<ShardData>                        shardDataPool(shardCount);

  // shared by the worker threads of this call only:
  std::atomic<bool> isWorkerThreadException(false);

  // The future<void> provides a simple way for worker thread exceptions to propagate down to this thread:
  std::vector<std::future<void>> shardReturnValues;
  for (unsigned shardIndex(0); shardIndex < shardCount; ++shardIndex) {
    const unsigned beginIndex((static_cast<uint64_t>(locusCount) * shardIndex) / shardCount);
    const unsigned endIndex((static_cast<uint64_t>(locusCount) * (shardIndex + 1)) / shardCount);
    shardReturnValues.push_back(std::async(
        std::launch::async,
        &TrinucleotideCaller::processLocusShard,
        this,
        std::cref(lociRows),
        beginIndex,
        endIndex,
        std::ref(recordSlots),
        std::ref(shardDataPool[shardIndex]),
        std::ref(isWorkerThreadException)));
  }

  // This is sufficient to rethrow any worker thread exceptions:
  for (auto& shardReturnValue : shardReturnValues) {
    shardReturnValue.get();
  }

  for (const ShardData& shardData : shardDataPool) {
    stats.merge(shardData.stats);
    spectrum.merge(shardData.spectrum);
  }

  for (auto& recordSlot : recordSlots) {
    if (!recordSlot) continue;
    records.push_back(std::move(*recordSlot));
  }
}
