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
/// \author Chris Saunders
///

#pragma once

#include "blt_util/blt_types.hpp"

#include <cstdint>

#include <iterator>
#include <string>

namespace BASE_ID {
enum index_t { A, C, G, T, ANY, SIZE };
}

enum { N_BASE = 4 };

/// throws blt_exception describing the invalid base
void base_error(const char* func, const char a);

inline uint8_t base_to_id(const char a)
{
  using namespace BASE_ID;
  switch (a) {
  case 'A':
    return A;
  case 'C':
    return C;
  case 'G':
    return G;
  case 'T':
    return T;
  case 'N':
    return ANY;
  default:
    base_error("base_to_id", a);
    return ANY;
  }
}

void id_to_base_error(const uint8_t i);

inline char id_to_base(const uint8_t i)
{
  static const char base[] = "ACGTN";

  if (i > N_BASE) id_to_base_error(i);
  return base[i];
}

/// true for an unambiguous nucleotide [ACGT]
inline bool is_acgt_base(const char a)
{
  switch (a) {
  case 'A':
  case 'C':
  case 'G':
  case 'T':
    return true;
  default:
    return false;
  }
}

/// valid in the ELAND sense [ACGTN]
inline bool is_valid_base(const char a)
{
  return (is_acgt_base(a) || (a == 'N'));
}

inline bool is_iupac_base(const char a)
{
  switch (a) {
  case 'A':
  case 'C':
  case 'G':
  case 'U':
  case 'T':
  case 'R':
  case 'Y':
  case 'S':
  case 'W':
  case 'K':
  case 'M':
  case 'B':
  case 'D':
  case 'H':
  case 'V':
  case '.':
  case '-':
  case 'N':
    return true;
  default:
    return false;
  }
}

/// true if every character of seq is in [ACGT]
bool is_acgt_seq(const std::string& seq);

inline char elandize_base(const char a)
{
  switch (a) {
  case 'A':
    return 'A';
  case 'C':
    return 'C';
  case 'G':
    return 'G';
  case 'U':
  case 'T':
    return 'T';
  case 'R':
  case 'Y':
  case 'S':
  case 'W':
  case 'K':
  case 'M':
  case 'B':
  case 'D':
  case 'H':
  case 'V':
  case '.':
  case '-':
  case 'N':
    return 'N';
  default:
    base_error("elandize_base", a);
    return 'N';
  }
}

inline char comp_base(const char a)
{
  switch (a) {
  case 'A':
    return 'T';
  case 'C':
    return 'G';
  case 'G':
    return 'C';
  case 'T':
    return 'A';
  case 'N':
    return 'N';
  default:
    base_error("comp_base", a);
    return 'N';
  }
}

/// purines anchor the reverse strand in the pyrimidine-reference convention
inline bool is_purine_base(const char a)
{
  return ((a == 'A') || (a == 'G'));
}

// generalized copy revcomp -- requires bidirectional iterators
//
template <typename ConstIter, typename Iter>
void reverseCompCopy(ConstIter cb, ConstIter ce, Iter b)
{
  while (cb != ce) {
    *b++ = comp_base(*--ce);
  }
}

// easy string->string version:
inline std::string reverseCompCopyStr(const std::string& seq)
{
  std::string result;
  reverseCompCopy(seq.begin(), seq.end(), std::back_insert_iterator<std::string>(result));
  return result;
}

/// Standardize reference sequence to [ACGTN]. Throws when a non-IUPAC
/// character is found.
///
/// \param offset zero-indexed position of the first base of ref_seq, used for error reporting only
void standardize_ref_seq(
    const char* ref_seq_file, const char* chr_name, std::string& ref_seq, const pos_t offset);
