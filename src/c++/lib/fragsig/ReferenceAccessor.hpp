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
/// \brief Reference genome sequence retrieval capability
///

#pragma once

#include "blt_util/blt_types.hpp"

#include <string>

/// \brief Retrieves reference sequence for a genomic interval
///
/// Implementations must support concurrent calls to fetch().
struct ReferenceAccessor {
  virtual ~ReferenceAccessor() = default;

  /// \brief Fetch the reference bases of a chromosome interval
  ///
  /// \param[in] beginPos 1-indexed start of the closed interval
  /// \param[in] endPos 1-indexed end of the closed interval
  /// \param[out] seq upper-case sequence, truncated where the interval extends past the chromosome end
  virtual void fetch(const std::string& chrom, const pos_t beginPos, const pos_t endPos, std::string& seq)
      const = 0;
};
