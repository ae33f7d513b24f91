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

#pragma once

#include <string>

/// Fragment ends contributing motifs
namespace FRAGMENT_END {
enum index_t { START, END, BOTH, SIZE };

/// single letter labels used on the command line
inline const char* label(const index_t idx)
{
  switch (idx) {
  case START:
    return "s";
  case END:
    return "e";
  case BOTH:
    return "b";
  default:
    return "UNKNOWN";
  }
}

inline bool isStart(const index_t idx) { return ((idx == START) || (idx == BOTH)); }

inline bool isEnd(const index_t idx) { return ((idx == END) || (idx == BOTH)); }

/// \return false if \p str is not a fragment end label
bool parseLabel(const std::string& str, index_t& idx);
}  // namespace FRAGMENT_END

/// \brief Parameters of the fragment end motif profile
///
struct EndMotifOptions {
  enum { MAX_MOTIF_LENGTH = 10 };

  FRAGMENT_END::index_t motifType = FRAGMENT_END::START;

  /// Number of reference bases read into the fragment from each counted end
  unsigned motifLength = 3;

  /// Profile reference-supporting against mutant-supporting fragment-locus pairs, instead of profiling
  /// all fragments together
  bool isIntegrateMutant = false;
};
