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
/// \brief Genome-wide SBS96 spectrum stratified by read-pair overlap type
///

#pragma once

#include "fragsig/Sbs96Channel.hpp"
#include "fragsig/SupportTally.hpp"

#include <array>
#include <set>
#include <string>
#include <vector>

/// Scale of the values reported by SpectrumAggregator::getSpectrum()
namespace SPECTRUM_SCALE {
enum index_t {
  /// raw counts
  COUNT,
  /// fractions of the total count over all channels and strata
  TOTAL_FRACTION,
  /// fractions of the total count over all channels of the entry's own stratum
  STRATUM_FRACTION
};
}

/// Read-pair topology of the support behind a consensus call
namespace OVERLAP_TYPE {
enum index_t { CO_MUT, SO_MUT, DO, SIZE };

inline const char* label(const index_t idx)
{
  switch (idx) {
  case CO_MUT:
    return "CO_MUT";
  case SO_MUT:
    return "SO_MUT";
  case DO:
    return "DO";
  default:
    return "UNKNOWN";
  }
}

/// \brief Map a consensus support category to its overlap stratum
///
/// Other-base support is folded into the mutant stratum of the same topology.
///
/// \return false for reference support categories
bool getOverlapType(const SUPPORT_TYPE::index_t category, index_t& idx);
}  // namespace OVERLAP_TYPE

/// \brief Optional support tally filters applied before spectrum counting
///
struct SpectrumFilter {
  /// \return true if a record with \p tally should be left out of the spectrum
  bool isFiltered(const SupportTally& tally) const;

  /// drop a record if any of these categories has support
  std::set<SUPPORT_TYPE::index_t> excludeIfTypePresent;

  /// when non-empty, keep a record only if one of these categories has support
  std::set<SUPPORT_TYPE::index_t> retainIfTypePresent;
};

struct SpectrumEntry {
  Sbs96Channel           channel;
  OVERLAP_TYPE::index_t overlapType = OVERLAP_TYPE::CO_MUT;
  double                 value       = 0;
};

/// \brief Accumulates consensus record counts per SBS96 channel and overlap stratum
///
/// Aggregators built over separate locus shards are combined with merge().
class SpectrumAggregator {
public:
  SpectrumAggregator() { clear(); }

  void clear();

  void addRecord(const Sbs96Channel& channel, const OVERLAP_TYPE::index_t overlapType);

  void merge(const SpectrumAggregator& rhs);

  unsigned getCount(const Sbs96Channel& channel, const OVERLAP_TYPE::index_t overlapType) const
  {
    return _counts[channel.index()][overlapType];
  }

  /// total count over all channels and strata
  unsigned totalCount() const;

  /// total count over all channels of one stratum
  unsigned stratumCount(const OVERLAP_TYPE::index_t overlapType) const;

  /// \brief Get the long-form spectrum, one entry per (channel, stratum) in canonical channel order
  ///
  /// Fractions with a zero denominator are reported as zero.
  void getSpectrum(const SPECTRUM_SCALE::index_t scale, std::vector<SpectrumEntry>& spectrum) const;

private:
  std::array<std::array<unsigned, OVERLAP_TYPE::SIZE>, Sbs96Channel::SIZE> _counts;
};
