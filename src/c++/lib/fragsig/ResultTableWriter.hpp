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
/// \brief Writers for the consensus and spectrum tables
///

#pragma once

#include "fragsig/SpectrumAggregator.hpp"
#include "fragsig/TrinucleotideCaller.hpp"

#include <iosfwd>
#include <vector>

/// \brief Write one tab-delimited row per consensus record, with a header line
///
/// Columns are the target mutation, support counts and median fragment lengths per category, the
/// consensus mismatch and the SBS96 channel. Median lengths of categories without support and the
/// channel of records without a channel are written as "NA".
void writeConsensusTable(std::ostream& os, const std::vector<ConsensusRecord>& records);

/// \brief Write the long-form spectrum as tab-delimited "SBS overlap_type value" rows, with a header line
///
void writeSpectrumTable(std::ostream& os, const std::vector<SpectrumEntry>& spectrum);
