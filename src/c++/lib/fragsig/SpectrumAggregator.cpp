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

#include "fragsig/SpectrumAggregator.hpp"

namespace OVERLAP_TYPE {

bool getOverlapType(const SUPPORT_TYPE::index_t category, index_t& idx)
{
  switch (category) {
  case SUPPORT_TYPE::CO_MUT:
  case SUPPORT_TYPE::CO_OTHER:
    idx = CO_MUT;
    return true;
  case SUPPORT_TYPE::SO_MUT:
  case SUPPORT_TYPE::SO_OTHER:
    idx = SO_MUT;
    return true;
  case SUPPORT_TYPE::DO:
    idx = DO;
    return true;
  default:
    return false;
  }
}

}  // namespace OVERLAP_TYPE

bool SpectrumFilter::isFiltered(const SupportTally& tally) const
{
  for (const SUPPORT_TYPE::index_t supportType : excludeIfTypePresent) {
    if (tally.counts[supportType] > 0) return true;
  }

  if (retainIfTypePresent.empty()) return false;
  for (const SUPPORT_TYPE::index_t supportType : retainIfTypePresent) {
    if (tally.counts[supportType] > 0) return false;
  }
  return true;
}

void SpectrumAggregator::clear()
{
  for (auto& channelCounts : _counts) channelCounts.fill(0);
}

void SpectrumAggregator::addRecord(const Sbs96Channel& channel, const OVERLAP_TYPE::index_t overlapType)
{
  _counts[channel.index()][overlapType]++;
}

void SpectrumAggregator::merge(const SpectrumAggregator& rhs)
{
  for (unsigned channelIndex(0); channelIndex < Sbs96Channel::SIZE; ++channelIndex) {
    for (unsigned overlapIndex(0); overlapIndex < OVERLAP_TYPE::SIZE; ++overlapIndex) {
      _counts[channelIndex][overlapIndex] += rhs._counts[channelIndex][overlapIndex];
    }
  }
}

unsigned SpectrumAggregator::totalCount() const
{
  unsigned total(0);
  for (const auto& channelCounts : _counts) {
    for (const unsigned count : channelCounts) total += count;
  }
  return total;
}

unsigned SpectrumAggregator::stratumCount(const OVERLAP_TYPE::index_t overlapType) const
{
  unsigned total(0);
  for (const auto& channelCounts : _counts) total += channelCounts[overlapType];
  return total;
}

void SpectrumAggregator::getSpectrum(
    const SPECTRUM_SCALE::index_t scale, std::vector<SpectrumEntry>& spectrum) const
{
  spectrum.clear();
  spectrum.reserve(Sbs96Channel::SIZE * OVERLAP_TYPE::SIZE);

  const unsigned                            total(totalCount());
  std::array<unsigned, OVERLAP_TYPE::SIZE> stratumTotals;
  for (unsigned overlapIndex(0); overlapIndex < OVERLAP_TYPE::SIZE; ++overlapIndex) {
    stratumTotals[overlapIndex] = stratumCount(static_cast<OVERLAP_TYPE::index_t>(overlapIndex));
  }

  for (unsigned channelIndex(0); channelIndex < Sbs96Channel::SIZE; ++channelIndex) {
    for (unsigned overlapIndex(0); overlapIndex < OVERLAP_TYPE::SIZE; ++overlapIndex) {
      SpectrumEntry entry;
      entry.channel     = Sbs96Channel::fromIndex(channelIndex);
      entry.overlapType = static_cast<OVERLAP_TYPE::index_t>(overlapIndex);

      const unsigned count(_counts[channelIndex][overlapIndex]);
      if (scale == SPECTRUM_SCALE::COUNT) {
        entry.value = count;
      } else {
        const unsigned denominator(
            (scale == SPECTRUM_SCALE::TOTAL_FRACTION) ? total : stratumTotals[overlapIndex]);
        entry.value = ((denominator > 0) ? (static_cast<double>(count) / denominator) : 0.);
      }
      spectrum.push_back(entry);
    }
  }
}
