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

#include "fragsig/ResultTableWriter.hpp"

#include <iostream>

static const char sep('\t');
static const char naField[] = "NA";

void writeConsensusTable(std::ostream& os, const std::vector<ConsensusRecord>& records)
{
  os << "target_mutation";
  for (int i(0); i < SUPPORT_TYPE::SIZE; ++i) {
    os << sep << SUPPORT_TYPE::label(static_cast<SUPPORT_TYPE::index_t>(i));
  }
  for (int i(0); i < SUPPORT_TYPE::SIZE; ++i) {
    os << sep << SUPPORT_TYPE::label(static_cast<SUPPORT_TYPE::index_t>(i)) << "_flength";
  }
  os << sep << "consensus_mismatch" << sep << "SBS96" << "\n";

  for (const ConsensusRecord& record : records) {
    const LocusConsensus& consensus(record.consensus);
    const SupportTally&   tally(consensus.tally);

    os << consensus.locus.getTargetKey();
    for (const unsigned count : tally.counts) {
      os << sep << count;
    }
    for (int i(0); i < SUPPORT_TYPE::SIZE; ++i) {
      const SUPPORT_TYPE::index_t supportType(static_cast<SUPPORT_TYPE::index_t>(i));
      os << sep;
      if (tally.hasMedianLength(supportType)) {
        os << tally.medianLength[supportType];
      } else {
        os << naField;
      }
    }
    os << sep << consensus.getConsensusMismatch() << sep;
    if (record.hasChannel()) {
      os << record.channel;
    } else {
      os << naField;
    }
    os << "\n";
  }
}

void writeSpectrumTable(std::ostream& os, const std::vector<SpectrumEntry>& spectrum)
{
  os << "SBS" << sep << "overlap_type" << sep << "value" << "\n";
  for (const SpectrumEntry& entry : spectrum) {
    os << entry.channel << sep << OVERLAP_TYPE::label(entry.overlapType) << sep << entry.value << "\n";
  }
}
