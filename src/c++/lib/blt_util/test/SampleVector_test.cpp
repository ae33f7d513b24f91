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

#include "SampleVector.hpp"

#include <random>
#include <set>
#include <vector>

BOOST_AUTO_TEST_SUITE(test_SampleVector)

BOOST_AUTO_TEST_CASE(test_SampleVectorUnderfilled)
{
  std::mt19937                    rngEngine(0);
  SampleVector<int, std::mt19937> sv(5, rngEngine);

  for (int i(0); i < 3; ++i) {
    sv.push(i);
  }

  // every input is kept, in input order:
  BOOST_REQUIRE(!sv.isDownsampled());
  BOOST_REQUIRE_EQUAL(sv.inputCount(), 3u);
  BOOST_REQUIRE_EQUAL(sv.data().size(), 3u);
  BOOST_REQUIRE_EQUAL(sv.data()[0], 0);
  BOOST_REQUIRE_EQUAL(sv.data()[2], 2);
}

BOOST_AUTO_TEST_CASE(test_SampleVectorWithoutReplacement)
{
  std::mt19937                    rngEngine(0);
  SampleVector<int, std::mt19937> sv(10, rngEngine);

  for (int i(0); i < 100; ++i) {
    sv.push(i);
  }

  BOOST_REQUIRE(sv.isDownsampled());
  BOOST_REQUIRE_EQUAL(sv.inputCount(), 100u);
  BOOST_REQUIRE_EQUAL(sv.data().size(), 10u);

  // sampled values can't be made portable, but they must be distinct inputs:
  const std::set<int> values(sv.data().begin(), sv.data().end());
  BOOST_REQUIRE_EQUAL(values.size(), 10u);
  BOOST_REQUIRE(*values.begin() >= 0);
  BOOST_REQUIRE(*values.rbegin() < 100);
}

BOOST_AUTO_TEST_CASE(test_SampleVectorZeroSize)
{
  std::mt19937                    rngEngine(0);
  SampleVector<int, std::mt19937> sv(0, rngEngine);

  sv.push(1);
  sv.push(2);
  BOOST_REQUIRE_EQUAL(sv.inputCount(), 2u);
  BOOST_REQUIRE(sv.data().empty());
}

BOOST_AUTO_TEST_CASE(test_SampleVectorRange)
{
  const std::vector<int> lengths = {166, 143, 320, 171};

  std::mt19937                    rngEngine(7);
  SampleVector<int, std::mt19937> sv(4, rngEngine);
  sv.push(lengths.begin(), lengths.end());

  BOOST_REQUIRE(!sv.isDownsampled());
  BOOST_REQUIRE(sv.data() == lengths);

  sv.push(lengths.begin(), lengths.begin() + 2);
  BOOST_REQUIRE(sv.isDownsampled());
  BOOST_REQUIRE_EQUAL(sv.inputCount(), 6u);
  BOOST_REQUIRE_EQUAL(sv.data().size(), 4u);
}

BOOST_AUTO_TEST_SUITE_END()
