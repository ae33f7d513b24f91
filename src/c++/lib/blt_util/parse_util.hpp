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

#include <string>

namespace fragsig {
namespace blt_util {

/// \brief Parse a c-string to int
///
/// Tolerates a non-int suffix, but a non-empty prefix must be parsable as an int. On completion \p s
/// points to the first character past the parsed prefix.
int parse_int(const char*& s);

/// \brief Parse a c-string to int, the entire string must be convertible
///
/// Appropriate for rvalue char pointers.
int parse_int_rvalue(const char* s);

/// \brief Parse a std::string to int, the entire string must be convertible
int parse_int_str(const std::string& s);

}  // namespace blt_util
}  // namespace fragsig
