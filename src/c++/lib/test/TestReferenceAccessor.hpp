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
/// \brief In-memory reference accessor for unit testing
///

#pragma once

#include "fragsig/ReferenceAccessor.hpp"

#include <map>
#include <string>

/// \brief Serves reference sequence from contigs held in memory
///
struct TestReferenceAccessor : public ReferenceAccessor {
  void addContig(const std::string& chrom, const std::string& seq) { _contigs[chrom] = seq; }

  /// unknown chromosomes and intervals past the contig end give truncated (possibly empty) sequence
  void fetch(const std::string& chrom, const pos_t beginPos, const pos_t endPos, std::string& seq)
      const override
  {
    seq.clear();
    const auto contigIter(_contigs.find(chrom));
    if (contigIter == _contigs.end()) return;
    const std::string& contig(contigIter->second);
    if ((beginPos < 1) || (static_cast<unsigned>(beginPos) > contig.size())) return;
    seq = contig.substr(beginPos - 1, endPos - beginPos + 1);
  }

private:
  std::map<std::string, std::string> _contigs;
};
