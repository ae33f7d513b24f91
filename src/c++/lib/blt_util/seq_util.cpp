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

#include "blt_util/seq_util.hpp"
#include "blt_util/blt_exception.hpp"

#include <cctype>

#include <sstream>

void base_error(const char* func, const char a)
{
  std::ostringstream oss;
  oss << "Invalid base in " << func << ". "
      << "invalid base (char): '" << a << "' "
      << "invalid base (int): " << static_cast<int>(a);
  throw blt_exception(oss.str().c_str());
}

void id_to_base_error(const uint8_t i)
{
  std::ostringstream oss;
  oss << "Invalid id in id_to_base. id: " << static_cast<int>(i);
  throw blt_exception(oss.str().c_str());
}

bool is_acgt_seq(const std::string& seq)
{
  for (const char c : seq) {
    if (!is_acgt_base(c)) return false;
  }
  return true;
}

void standardize_ref_seq(
    const char* ref_seq_file, const char* chr_name, std::string& ref_seq, const pos_t offset)
{
  const std::string::size_type ref_size(ref_seq.size());
  for (std::string::size_type i(0); i < ref_size; ++i) {
    const char old_ref(ref_seq[i]);
    char       c(old_ref);
    if (islower(c)) c = toupper(c);
    if (!is_valid_base(c)) {
      if (!is_iupac_base(c)) {
        static const char def_chr_name[] = "first-sequence-in-file";
        const char*       seq_name(nullptr != chr_name ? chr_name : def_chr_name);

        std::ostringstream oss;
        oss << "Unexpected character in reference sequence.\n"
            << "\treference_sequence_file: '" << ref_seq_file << "'\n"
            << "\tchromosome: '" << seq_name << "'\n"
            << "\tcharacter: '" << old_ref << "'\n"
            << "\tcharacter_decimal_index: " << static_cast<int>(old_ref) << "\n"
            << "\tcharacter_position_in_chromosome: " << (i + 1 + offset) << "\n";
        throw blt_exception(oss.str().c_str());
      }
      c = elandize_base(c);
    }
    if (c != old_ref) ref_seq[i] = c;
  }
}
