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

#include "fragsig/FastaReferenceAccessor.hpp"

#include "blt_util/seq_util.hpp"
#include "common/Exceptions.hpp"

#include <cstdlib>
#include <sstream>

FastaReferenceAccessor::FastaReferenceAccessor(const std::string& referenceFilename)
  : _referenceFilename(referenceFilename), _faidx(fai_load(referenceFilename.c_str()))
{
  if (_faidx == nullptr) {
    using namespace fragsig::common;
    std::ostringstream oss;
    oss << "Can't load reference fasta index for file: '" << _referenceFilename << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }
}

FastaReferenceAccessor::~FastaReferenceAccessor()
{
  fai_destroy(_faidx);
}

void FastaReferenceAccessor::fetch(
    const std::string& chrom, const pos_t beginPos, const pos_t endPos, std::string& seq) const
{
  using namespace fragsig::common;

  seq.clear();
  if ((beginPos < 1) || (endPos < beginPos)) {
    std::ostringstream oss;
    oss << "Invalid reference interval " << chrom << ":" << beginPos << "-" << endPos;
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }

  std::lock_guard<std::mutex> lock(_fetchMutex);

  if (!faidx_has_seq(_faidx, chrom.c_str())) {
    std::ostringstream oss;
    oss << "Chromosome '" << chrom << "' is not found in reference fasta file: '" << _referenceFilename
        << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }

  int   seqLength(0);
  char* refSeq(faidx_fetch_seq(_faidx, chrom.c_str(), beginPos - 1, endPos - 1, &seqLength));
  if (refSeq == nullptr) {
    std::ostringstream oss;
    oss << "Can't fetch reference interval " << chrom << ":" << beginPos << "-" << endPos
        << " from reference fasta file: '" << _referenceFilename << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }

  if (seqLength > 0) seq.assign(refSeq, seqLength);
  free(refSeq);

  standardize_ref_seq(_referenceFilename.c_str(), chrom.c_str(), seq, beginPos - 1);
}
