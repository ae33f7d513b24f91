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

#include "random_util.hpp"

#include <random>
#include <set>
#include <vector>

namespace {

/// engine with output range [0,9] which replays a fixed sequence
struct ScriptedEngine {
  typedef unsigned result_type;

  static constexpr result_type min() { return 0; }
  static constexpr result_type max() { return 9; }

  result_type operator()() { return values[index++]; }

  std::vector<result_type> values;
  unsigned                 index = 0;
};

}  // namespace

BOOST_AUTO_TEST_SUITE(test_random_util)

BOOST_AUTO_TEST_CASE(test_get_uniform_index_mt19937)
{
  // std::mt19937 output is fully specified, so these draws hold for every standard library:
  std::mt19937                rng;
  const std::vector<unsigned> expected = {2, 2, 4, 5, 4};
  for (const unsigned index : expected) {
    BOOST_REQUIRE_EQUAL(get_uniform_index(rng, 10), index);
  }
}

BOOST_AUTO_TEST_CASE(test_get_uniform_index_rejection)
{
  // with size 4, engine values 8 and 9 fall in the partial top range and are drawn again:
  ScriptedEngine rng;
  rng.values = {9, 8, 5, 3};
  BOOST_REQUIRE_EQUAL(get_uniform_index(rng, 4), 1u);
  BOOST_REQUIRE_EQUAL(rng.index, 3u);
  BOOST_REQUIRE_EQUAL(get_uniform_index(rng, 4), 3u);
}

BOOST_AUTO_TEST_CASE(test_get_uniform_index_range)
{
  std::mt19937       rng(123);
  std::set<unsigned> drawn;
  for (unsigned i(0); i < 200; ++i) {
    const unsigned index(get_uniform_index(rng, 3));
    BOOST_REQUIRE(index < 3);
    drawn.insert(index);
  }
  BOOST_REQUIRE_EQUAL(drawn.size(), 3u);

  BOOST_REQUIRE_EQUAL(get_uniform_index(rng, 1), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
