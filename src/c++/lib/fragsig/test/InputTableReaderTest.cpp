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

#include "common/Exceptions.hpp"
#include "fragsig/InputTableReader.hpp"
#include "test/testFileMakers.hpp"

#include <sstream>
#include <string>

BOOST_AUTO_TEST_SUITE(test_InputTableReader)

BOOST_AUTO_TEST_CASE(test_readLocusTable)
{
  std::istringstream iss(
      "#chrom\tpos\tref\talt\n"
      "chr1\t1000000\tC\tT\n"
      "\n"
      "chr2\t500\tG\tA\textra\n"
      "chr1\t1000000\tC\tA\n");

  LocusTable loci;
  RunStats   stats;
  readLocusTable(iss, "test", loci, stats);

  BOOST_REQUIRE_EQUAL(loci.size(), 2u);
  BOOST_REQUIRE_EQUAL(stats.locusCount, 2u);
  BOOST_REQUIRE_EQUAL(stats.duplicateLocusCount, 1u);

  const Locus* locusPtr(loci.findLocus(LocusKey("chr1", 1000000)));
  BOOST_REQUIRE(locusPtr != nullptr);
  BOOST_REQUIRE_EQUAL(locusPtr->refBase, 'C');
  BOOST_REQUIRE_EQUAL(locusPtr->altBase, 'T');
}

BOOST_AUTO_TEST_CASE(test_readLocusTableMalformed)
{
  using namespace fragsig::common;

  LocusTable loci;
  RunStats   stats;

  std::istringstream shortRow("chr1\t100\tC\n");
  BOOST_REQUIRE_THROW(readLocusTable(shortRow, "test", loci, stats), InputFormatException);

  std::istringstream badPos("chr1\tabc\tC\tT\n");
  BOOST_REQUIRE_THROW(readLocusTable(badPos, "test", loci, stats), InputFormatException);

  std::istringstream badBase("chr1\t100\tCT\tT\n");
  BOOST_REQUIRE_THROW(readLocusTable(badBase, "test", loci, stats), InputFormatException);
}

BOOST_AUTO_TEST_CASE(test_readLocusTableErrorLocation)
{
  using namespace fragsig::common;

  LocusTable loci;
  RunStats   stats;

  // the comment and blank lines still count toward the reported line number:
  std::istringstream iss("#chrom\tpos\tref\talt\nchr1\t100\tC\tT\n\nchr1\t0\tC\tT\n");
  bool isThrown(false);
  try {
    readLocusTable(iss, "loci.tsv", loci, stats);
  } catch (const InputFormatException& e) {
    isThrown = true;
    const std::string* sourcePtr(boost::get_error_info<InputSource>(e));
    const unsigned*    linePtr(boost::get_error_info<InputLineNumber>(e));
    BOOST_REQUIRE(nullptr != sourcePtr);
    BOOST_REQUIRE(nullptr != linePtr);
    BOOST_REQUIRE_EQUAL(*sourcePtr, "loci.tsv");
    BOOST_REQUIRE_EQUAL(*linePtr, 4u);
    BOOST_REQUIRE(e.getContext().find("in input 'loci.tsv' line 4") != std::string::npos);
  }
  BOOST_REQUIRE(isThrown);
}

BOOST_AUTO_TEST_CASE(test_readFragmentTable)
{
  std::istringstream iss(
      "#fragment_id\tchrom\tstart\tend\tstrand\tlocus_key\tlocus_info\tlocus_status\n"
      "frag1\tchr1\t999901\t1000066\t+\tchr1:1000000\tTT\tMUT:concordant\n"
      "frag1\tchr1\t999901\t1000066\t+\tchr1:1000050\tREF\t.\n"
      "frag2\tchr1\t999950\t1000120\t-\tchr1:1000000\tRT\tMUT:discordant\n"
      "frag3\tchr2\t100\t266\t*\t.\t.\t.\n");

  FragmentStore fragments;
  readFragmentTable(iss, "test", fragments);

  BOOST_REQUIRE_EQUAL(fragments.size(), 3u);

  const Fragment& frag1(fragments.getFragments()[0]);
  BOOST_REQUIRE_EQUAL(frag1.fragmentId, "frag1");
  BOOST_REQUIRE_EQUAL(frag1.getLength(), 166);
  BOOST_REQUIRE_EQUAL(frag1.strand, '+');
  BOOST_REQUIRE_EQUAL(frag1.annotations.size(), 2u);
  BOOST_REQUIRE(frag1.annotations[0].isUpstreamStatus);
  BOOST_REQUIRE_EQUAL(frag1.annotations[0].upstreamStatus, LOCUS_STATUS::MUT_CONCORDANT);
  BOOST_REQUIRE_EQUAL(frag1.annotations[1].locusKey, LocusKey("chr1", 1000050));
  BOOST_REQUIRE_EQUAL(frag1.annotations[1].locusInfo, "REF");
  BOOST_REQUIRE(!frag1.annotations[1].isUpstreamStatus);

  const Fragment& frag3(fragments.getFragments()[2]);
  BOOST_REQUIRE_EQUAL(frag3.chrom, "chr2");
  BOOST_REQUIRE(frag3.annotations.empty());
}

BOOST_AUTO_TEST_CASE(test_readFragmentTableMalformed)
{
  using namespace fragsig::common;

  {
    FragmentStore      fragments;
    std::istringstream iss("frag1\tchr1\t100\t50\t+\t.\t.\t.\n");
    BOOST_REQUIRE_THROW(readFragmentTable(iss, "test", fragments), InputFormatException);
  }

  {
    FragmentStore      fragments;
    std::istringstream iss("frag1\tchr1\t100\t250\t+\tchr1:120\tTTT\t.\n");
    BOOST_REQUIRE_THROW(readFragmentTable(iss, "test", fragments), InputFormatException);
  }

  {
    FragmentStore      fragments;
    std::istringstream iss("frag1\tchr1\t100\t250\t+\tchr1:120\tT\tMUT:unknown\n");
    BOOST_REQUIRE_THROW(readFragmentTable(iss, "test", fragments), InputFormatException);
  }

  {
    // the same fragment id must keep the same interval:
    FragmentStore      fragments;
    std::istringstream iss(
        "frag1\tchr1\t100\t250\t+\tchr1:120\tT\t.\n"
        "frag1\tchr1\t101\t250\t+\tchr1:130\tT\t.\n");
    BOOST_REQUIRE_THROW(readFragmentTable(iss, "test", fragments), InputFormatException);
  }
}

BOOST_AUTO_TEST_CASE(test_readLocusTableFile)
{
  const TestTextFileMaker locusFile("chr1\t100\tC\tT\n");

  LocusTable loci;
  RunStats   stats;
  readLocusTable(locusFile.getFilename(), loci, stats);
  BOOST_REQUIRE_EQUAL(loci.size(), 1u);

  BOOST_REQUIRE_THROW(
      readLocusTable(locusFile.getFilename() + ".missing", loci, stats), fragsig::common::GeneralException);
}

BOOST_AUTO_TEST_SUITE_END()
