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
/// \brief Paired-end fragments with per-locus mate observations
///

#pragma once

#include "blt_util/blt_types.hpp"
#include "fragsig/LocusKey.hpp"
#include "fragsig/LocusStatus.hpp"

#include <string>
#include <unordered_map>
#include <vector>

/// \brief Mate observations of one fragment at one locus, as reported by the upstream annotation step
///
struct LocusAnnotation {
  LocusKey locusKey;

  /// Raw per-mate base token: one character per covering mate from [ACGTN], 'R' for the unresolved
  /// "matches reference" placeholder, or the literal "REF" for a single reference-supporting mate.
  std::string locusInfo;

  /// true if the upstream step labeled this pair with a status
  bool isUpstreamStatus = false;

  LOCUS_STATUS::index_t upstreamStatus = LOCUS_STATUS::OUTER_FRAGMENT;
};

struct Fragment {
  /// length of the closed interval [beginPos,endPos]
  pos_t getLength() const { return (endPos - beginPos + 1); }

  std::string fragmentId;
  std::string chrom;

  /// 1-indexed closed interval
  pos_t beginPos = 0;
  pos_t endPos   = 0;

  char strand = '*';

  std::vector<LocusAnnotation> annotations;
};

/// \brief Strip the numeric suffix used upstream to disambiguate repeated read-pair names
///
/// "readX.1" and "readX.2" both map to "readX". Identifiers without a trailing ".<digits>" suffix are
/// returned unchanged.
std::string getLogicalFragmentId(const std::string& fragmentId);

/// \brief Insertion-ordered fragment collection indexed by the raw fragment identifier
///
/// Annotation rows sharing an identical raw fragment identifier are accumulated onto a single fragment.
struct FragmentStore {
  /// \brief Find or create the fragment with id \p fragmentId
  ///
  /// \param[out] isNew true if the fragment was created by this call
  /// \return index of the fragment in getFragments()
  unsigned addFragment(
      const std::string& fragmentId,
      const std::string& chrom,
      const pos_t        beginPos,
      const pos_t        endPos,
      const char         strand,
      bool&              isNew);

  void addAnnotation(const unsigned fragmentIndex, const LocusAnnotation& annotation);

  const std::vector<Fragment>& getFragments() const { return _fragments; }

  unsigned size() const { return _fragments.size(); }

private:
  std::vector<Fragment>                     _fragments;
  std::unordered_map<std::string, unsigned> _idIndex;
};
