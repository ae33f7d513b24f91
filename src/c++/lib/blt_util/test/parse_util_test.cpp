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

#include "boost/test/unit_test.hpp"

#include "parse_util.hpp"

#include <string>

BOOST_AUTO_TEST_SUITE(parse_util)

using namespace fragsig::blt_util;

BOOST_AUTO_TEST_CASE(test_parse_int)
{
  const char* two = "2";
  const int   val(parse_int(two));
  BOOST_REQUIRE_EQUAL(val, 2);
  BOOST_REQUIRE_EQUAL(*two, '\0');
}

BOOST_AUTO_TEST_CASE(test_parse_int_big)
{
  const char* twobig = "20000000000";
  BOOST_REQUIRE_THROW(parse_int(twobig), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_int_small)
{
  const char* twosmall = "-20000000000000000000";
  BOOST_REQUIRE_THROW(parse_int(twosmall), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_int_empty)
{
  const char* empty = "";
  BOOST_REQUIRE_THROW(parse_int(empty), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_int_tolerate_suffix)
{
  const char* suffix = "123abc";
  const int   val(parse_int(suffix));
  BOOST_REQUIRE_EQUAL(val, 123);
  BOOST_REQUIRE_EQUAL(std::string(suffix), "abc");
}

BOOST_AUTO_TEST_CASE(test_parse_int_rval)
{
  BOOST_REQUIRE_EQUAL(parse_int_rvalue("1000000"), 1000000);
  BOOST_REQUIRE_THROW(parse_int_rvalue("123abc"), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_int_str)
{
  BOOST_REQUIRE_EQUAL(parse_int_str(std::string("-7")), -7);
  BOOST_REQUIRE_THROW(parse_int_str(std::string("ABCD")), std::exception);
  BOOST_REQUIRE_THROW(parse_int_str(std::string("12.5")), std::exception);
}

BOOST_AUTO_TEST_SUITE_END()
