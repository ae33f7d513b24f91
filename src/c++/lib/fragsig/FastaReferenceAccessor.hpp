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
/// \brief Reference accessor backed by an indexed FASTA file
///

#pragma once

#include "fragsig/ReferenceAccessor.hpp"

#include "htslib/faidx.h"

#include <mutex>
#include <string>

/// \brief Reads reference sequence from a FASTA file through htslib faidx
///
/// The index is loaded once on construction (and built when no .fai file exists yet). A missing
/// FASTA file or an unknown chromosome name is a fatal error for the run.
class FastaReferenceAccessor : public ReferenceAccessor {
public:
  explicit FastaReferenceAccessor(const std::string& referenceFilename);

  ~FastaReferenceAccessor() override;

  FastaReferenceAccessor(const FastaReferenceAccessor&) = delete;
  FastaReferenceAccessor& operator=(const FastaReferenceAccessor&) = delete;

  void fetch(const std::string& chrom, const pos_t beginPos, const pos_t endPos, std::string& seq)
      const override;

private:
  const std::string _referenceFilename;
  faidx_t*          _faidx;

  /// faidx_t shares a single file handle across fetches
  mutable std::mutex _fetchMutex;
};
