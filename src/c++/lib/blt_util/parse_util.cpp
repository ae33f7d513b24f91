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

#include "blt_util/parse_util.hpp"
#include "blt_util/blt_exception.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

#include <limits>
#include <sstream>

static void parse_exception(const char* type_label, const char* parse_str)
{
  std::ostringstream oss;
  oss << "Can't parse " << type_label << " from string: '" << parse_str << "'";
  throw blt_exception(oss.str().c_str());
}

namespace fragsig {
namespace blt_util {

static long parse_long_core(const char* s, const char*& s_out)
{
  static const int base(10);

  errno = 0;

  char*      endptr;
  const long val(strtol(s, &endptr, base));
  if ((errno == ERANGE && (val == LONG_MIN || val == LONG_MAX)) || (errno != 0 && val == 0) ||
      (endptr == s)) {
    parse_exception("long int", s);
  }

  s_out = endptr;

  return val;
}

static int parse_int_core(const char* s, const char*& s_out)
{
  const char* endptr(s);
  const long  val(parse_long_core(s, endptr));

  if ((val > std::numeric_limits<int>::max()) || (val < std::numeric_limits<int>::min())) {
    parse_exception("int", s);
  }

  s_out = endptr;

  return static_cast<int>(val);
}

int parse_int(const char*& s)
{
  return parse_int_core(s, s);
}

int parse_int_rvalue(const char* s)
{
  const char* s_tmp(nullptr);
  const int   val(parse_int_core(s, s_tmp));
  if (*s_tmp != '\0') {
    parse_exception("int", s);
  }
  return val;
}

int parse_int_str(const std::string& s)
{
  return parse_int_rvalue(s.c_str());
}

}  // namespace blt_util
}  // namespace fragsig
