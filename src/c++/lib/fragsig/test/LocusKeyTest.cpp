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

#include "fragsig/LocusKey.hpp"
#include "fragsig/LocusTable.hpp"

#include <sstream>

BOOST_AUTO_TEST_SUITE(test_LocusKey)

BOOST_AUTO_TEST_CASE(test_parseLocusKey)
{
  LocusKey key;
  BOOST_REQUIRE(parseLocusKey("chr1:1000000", key));
  BOOST_REQUIRE_EQUAL(key.chrom, "chr1");
  BOOST_REQUIRE_EQUAL(key.pos, 1000000);

  // chromosome names may contain the delimiter:
  BOOST_REQUIRE(parseLocusKey("HLA-A*01:01:01:01:250", key));
  BOOST_REQUIRE_EQUAL(key.chrom, "HLA-A*01:01:01:01");
  BOOST_REQUIRE_EQUAL(key.pos, 250);

  BOOST_REQUIRE(!parseLocusKey("chr1", key));
  BOOST_REQUIRE(!parseLocusKey(":100", key));
  BOOST_REQUIRE(!parseLocusKey("chr1:", key));
  BOOST_REQUIRE(!parseLocusKey("chr1:0", key));
  BOOST_REQUIRE(!parseLocusKey("chr1:12x", key));
}

BOOST_AUTO_TEST_CASE(test_LocusKeyOrder)
{
  BOOST_REQUIRE(LocusKey("chr1", 200) < LocusKey("chr2", 100));
  BOOST_REQUIRE(LocusKey("chr1", 100) < LocusKey("chr1", 200));
  BOOST_REQUIRE(!(LocusKey("chr1", 100) < LocusKey("chr1", 100)));
  BOOST_REQUIRE(LocusKey("chr1", 100) == LocusKey("chr1", 100));
  BOOST_REQUIRE(LocusKey("chr1", 100) != LocusKey("chr10", 100));
}

BOOST_AUTO_TEST_CASE(test_KeyOutput)
{
  const Locus locus(LocusKey("chr1", 1000000), 'C', 'T');

  std::ostringstream oss;
  oss << locus.key;
  BOOST_REQUIRE_EQUAL(oss.str(), "chr1:1000000");

  std::ostringstream oss2;
  oss2 << locus.getTargetKey();
  BOOST_REQUIRE_EQUAL(oss2.str(), "chr1:1000000:C:T");
}

BOOST_AUTO_TEST_CASE(test_LocusTableFirstSeenWins)
{
  LocusTable loci;
  BOOST_REQUIRE(loci.addLocus(Locus(LocusKey("chr1", 10), 'C', 'T')));
  BOOST_REQUIRE(loci.addLocus(Locus(LocusKey("chr2", 10), 'G', 'A')));
  BOOST_REQUIRE(!loci.addLocus(Locus(LocusKey("chr1", 10), 'C', 'A')));
  BOOST_REQUIRE_EQUAL(loci.size(), 2u);

  const Locus* locusPtr(loci.findLocus(LocusKey("chr1", 10)));
  BOOST_REQUIRE(locusPtr != nullptr);
  BOOST_REQUIRE_EQUAL(locusPtr->altBase, 'T');

  BOOST_REQUIRE(loci.findLocus(LocusKey("chr1", 11)) == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()
