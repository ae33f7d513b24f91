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

#include "blt_util/seq_util.hpp"

BOOST_AUTO_TEST_SUITE(test_seq_util)

BOOST_AUTO_TEST_CASE(test_base_id)
{
  for (uint8_t i(0); i < N_BASE; ++i) {
    BOOST_REQUIRE_EQUAL(base_to_id(id_to_base(i)), i);
  }
  BOOST_REQUIRE_EQUAL(id_to_base(BASE_ID::ANY), 'N');
  BOOST_REQUIRE_THROW(base_to_id('X'), std::exception);
}

BOOST_AUTO_TEST_CASE(test_base_classes)
{
  BOOST_REQUIRE(is_acgt_base('G'));
  BOOST_REQUIRE(!is_acgt_base('N'));
  BOOST_REQUIRE(is_acgt_seq("ACGT"));
  BOOST_REQUIRE(!is_acgt_seq("ACNT"));
  BOOST_REQUIRE(is_purine_base('A'));
  BOOST_REQUIRE(!is_purine_base('C'));
  BOOST_REQUIRE(is_iupac_base('R'));
  BOOST_REQUIRE(!is_iupac_base('X'));
}

BOOST_AUTO_TEST_CASE(test_reverseCompCopyStr)
{
  BOOST_REQUIRE_EQUAL(reverseCompCopyStr("AGA"), "TCT");
  BOOST_REQUIRE_EQUAL(reverseCompCopyStr("ACGTN"), "NACGT");
  BOOST_REQUIRE_EQUAL(reverseCompCopyStr(""), "");
}

BOOST_AUTO_TEST_CASE(test_standardize_ref_seq)
{
  std::string seq("acgTRn");
  standardize_ref_seq("test.fa", "chr1", seq, 0);
  BOOST_REQUIRE_EQUAL(seq, "ACGTNN");

  std::string badSeq("AC*T");
  BOOST_REQUIRE_THROW(standardize_ref_seq("test.fa", "chr1", badSeq, 0), std::exception);
}

BOOST_AUTO_TEST_SUITE_END()
