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

#include "fragsig/FragmentEndMotifProfile.hpp"
#include "test/TestReferenceAccessor.hpp"

#include <sstream>

namespace {

//                                  12345678901234567890
const std::string testContig("ACGTACGTAGATCCGATTGA");

Fragment makeFragment(
    const std::string& fragmentId, const pos_t beginPos, const pos_t endPos, const char strand)
{
  Fragment fragment;
  fragment.fragmentId = fragmentId;
  fragment.chrom      = "chr1";
  fragment.beginPos   = beginPos;
  fragment.endPos     = endPos;
  fragment.strand     = strand;
  return fragment;
}

struct TestMotifReference {
  TestMotifReference()
  {
    reference.addContig("chr1", testContig);
    reference.addContig("chrN", "ACNGTACGTA");
  }

  TestReferenceAccessor reference;
};

}  // namespace

BOOST_AUTO_TEST_SUITE(test_FragmentEndMotifProfile)

BOOST_AUTO_TEST_CASE(test_getAllMotifs)
{
  std::vector<std::string> motifs;
  getAllMotifs(1, motifs);
  const std::vector<std::string> expected = {"A", "C", "G", "T"};
  BOOST_REQUIRE(motifs == expected);

  getAllMotifs(2, motifs);
  BOOST_REQUIRE_EQUAL(motifs.size(), 16u);
  BOOST_REQUIRE_EQUAL(motifs[0], "AA");
  BOOST_REQUIRE_EQUAL(motifs[1], "AC");
  BOOST_REQUIRE_EQUAL(motifs[4], "CA");
  BOOST_REQUIRE_EQUAL(motifs[15], "TT");
}

BOOST_AUTO_TEST_CASE(test_getFragmentEndMotifs)
{
  const TestMotifReference test;
  std::vector<std::string> motifs;

  // forward fragment: start reads CGT at 2-4, end reads into GAT at 10-12 from the reverse strand:
  const Fragment forward(makeFragment("f1", 2, 12, '+'));
  getFragmentEndMotifs(test.reference, forward, FRAGMENT_END::BOTH, 3, motifs);
  BOOST_REQUIRE_EQUAL(motifs.size(), 2u);
  BOOST_REQUIRE_EQUAL(motifs[0], "CGT");
  BOOST_REQUIRE_EQUAL(motifs[1], "ATC");

  getFragmentEndMotifs(test.reference, forward, FRAGMENT_END::START, 3, motifs);
  BOOST_REQUIRE_EQUAL(motifs.size(), 1u);
  BOOST_REQUIRE_EQUAL(motifs[0], "CGT");

  getFragmentEndMotifs(test.reference, forward, FRAGMENT_END::END, 2, motifs);
  BOOST_REQUIRE_EQUAL(motifs.size(), 1u);
  BOOST_REQUIRE_EQUAL(motifs[0], "AT");

  // the reverse strand fragment swaps its start and end:
  const Fragment reverse(makeFragment("f2", 2, 12, '-'));
  getFragmentEndMotifs(test.reference, reverse, FRAGMENT_END::BOTH, 3, motifs);
  BOOST_REQUIRE_EQUAL(motifs[0], "ATC");
  BOOST_REQUIRE_EQUAL(motifs[1], "CGT");

  // unstranded fragments are read as forward:
  const Fragment unstranded(makeFragment("f3", 2, 12, '*'));
  getFragmentEndMotifs(test.reference, unstranded, FRAGMENT_END::START, 3, motifs);
  BOOST_REQUIRE_EQUAL(motifs[0], "CGT");
}

BOOST_AUTO_TEST_CASE(test_getFragmentEndMotifsClipped)
{
  const TestMotifReference test;
  std::vector<std::string> motifs;

  // end motif clipped by the chromosome start:
  const Fragment shortFragment(makeFragment("f1", 1, 1, '+'));
  getFragmentEndMotifs(test.reference, shortFragment, FRAGMENT_END::BOTH, 3, motifs);
  BOOST_REQUIRE_EQUAL(motifs[0], "ACG");
  BOOST_REQUIRE_EQUAL(motifs[1], "T");

  // start motif clipped by the chromosome end:
  const Fragment lastFragment(makeFragment("f2", 19, 20, '+'));
  getFragmentEndMotifs(test.reference, lastFragment, FRAGMENT_END::START, 3, motifs);
  BOOST_REQUIRE_EQUAL(motifs[0], "GA");
}

BOOST_AUTO_TEST_CASE(test_EndMotifCounter)
{
  EndMotifCounter counter(3);
  counter.addMotif("CGT");
  counter.addMotif("CGT");
  counter.addMotif("ATC");
  counter.addMotif("CNT");
  counter.addMotif("GA");

  BOOST_REQUIRE_EQUAL(counter.totalCount(), 3u);
  BOOST_REQUIRE_EQUAL(counter.getCount("CGT"), 2u);
  BOOST_REQUIRE_EQUAL(counter.getCount("CNT"), 0u);

  const auto& ambiguousCounts(counter.getAmbiguousMotifCounts());
  BOOST_REQUIRE_EQUAL(ambiguousCounts.size(), 2u);
  BOOST_REQUIRE_EQUAL(ambiguousCounts.at("CNT"), 1u);
  BOOST_REQUIRE_EQUAL(ambiguousCounts.at("GA"), 1u);

  std::vector<EndMotifEntry> profile;
  std::vector<std::string>   missingMotifs;
  counter.getProfile(profile, missingMotifs);

  // every motif is present, unobserved motifs with a count of 0:
  BOOST_REQUIRE_EQUAL(profile.size(), 64u);
  BOOST_REQUIRE_EQUAL(missingMotifs.size(), 62u);
  BOOST_REQUIRE_EQUAL(profile[0].motif, "AAA");
  BOOST_REQUIRE_EQUAL(profile[0].count, 0u);
  BOOST_REQUIRE_EQUAL(profile[13].motif, "ATC");
  BOOST_REQUIRE_EQUAL(profile[13].count, 1u);
  BOOST_REQUIRE_CLOSE(profile[13].fraction, 1. / 3., 0.0001);

  double fractionSum(0);
  for (const EndMotifEntry& entry : profile) fractionSum += entry.fraction;
  BOOST_REQUIRE_CLOSE(fractionSum, 1.0, 0.0001);
}

BOOST_AUTO_TEST_CASE(test_EmptyProfile)
{
  const EndMotifCounter counter(2);

  std::vector<EndMotifEntry> profile;
  std::vector<std::string>   missingMotifs;
  counter.getProfile(profile, missingMotifs);

  BOOST_REQUIRE_EQUAL(profile.size(), 16u);
  BOOST_REQUIRE_EQUAL(missingMotifs.size(), 16u);
  for (const EndMotifEntry& entry : profile) {
    BOOST_REQUIRE_EQUAL(entry.fraction, 0.);
  }
}

BOOST_AUTO_TEST_CASE(test_getEndMotifCounts)
{
  const TestMotifReference test;

  const Fragment fragment1(makeFragment("f1", 2, 12, '+'));
  const Fragment fragment2(makeFragment("f2", 5, 9, '-'));
  Fragment       fragment3(makeFragment("f3", 1, 8, '+'));
  fragment3.chrom = "chrN";

  std::vector<FragmentLocusRow> rows(4);
  rows[0].fragmentId  = "f1";
  rows[0].fragmentPtr = &fragment1;
  // the same fragment over a second locus is counted once:
  rows[1]             = rows[0];
  rows[2].fragmentId  = "f2";
  rows[2].fragmentPtr = &fragment2;
  rows[3].fragmentId  = "f3";
  rows[3].fragmentPtr = &fragment3;

  EndMotifOptions opt;
  EndMotifCounter counter(opt.motifLength);
  getEndMotifCounts(rows, test.reference, opt, counter);

  // f2 starts at its reverse strand end, GTA at 7-9 read as TAC, and f3 starts on a no-call:
  BOOST_REQUIRE_EQUAL(counter.totalCount(), 2u);
  BOOST_REQUIRE_EQUAL(counter.getCount("CGT"), 1u);
  BOOST_REQUIRE_EQUAL(counter.getCount("TAC"), 1u);
  BOOST_REQUIRE_EQUAL(counter.getAmbiguousMotifCounts().at("ACN"), 1u);
}

BOOST_AUTO_TEST_CASE(test_getEndMotifComparisonCounts)
{
  const TestMotifReference test;
  const Locus              locus(LocusKey("chr1", 6), 'C', 'T');

  const Fragment refFragment(makeFragment("f1", 2, 12, '+'));
  const Fragment mutFragment(makeFragment("f2", 2, 12, '-'));
  const Fragment otherFragment(makeFragment("f3", 5, 12, '+'));

  std::vector<ResolvedFragmentLocus> rows(5);
  rows[0].fragmentPtr = &refFragment;
  rows[0].locusPtr    = &locus;
  rows[0].status      = LOCUS_STATUS::REF_CONCORDANT;
  rows[1].fragmentPtr = &mutFragment;
  rows[1].locusPtr    = &locus;
  rows[1].status      = LOCUS_STATUS::MUT_SINGLE_READ;
  rows[2].fragmentPtr = &otherFragment;
  rows[2].locusPtr    = &locus;
  rows[2].status      = LOCUS_STATUS::MUT_DISCORDANT;
  rows[3].fragmentPtr = &otherFragment;
  rows[3].locusPtr    = &locus;
  rows[3].status      = LOCUS_STATUS::OTHER_BASE_CONCORDANT;
  rows[4].fragmentPtr = &otherFragment;

  EndMotifOptions opt;
  opt.motifType = FRAGMENT_END::BOTH;
  EndMotifCounter refCounter(opt.motifLength);
  EndMotifCounter mutCounter(opt.motifLength);
  getEndMotifComparisonCounts(rows, test.reference, opt, refCounter, mutCounter);

  BOOST_REQUIRE_EQUAL(refCounter.totalCount(), 2u);
  BOOST_REQUIRE_EQUAL(refCounter.getCount("CGT"), 1u);
  BOOST_REQUIRE_EQUAL(refCounter.getCount("ATC"), 1u);
  BOOST_REQUIRE_EQUAL(mutCounter.totalCount(), 2u);
  BOOST_REQUIRE_EQUAL(mutCounter.getCount("CGT"), 1u);
  BOOST_REQUIRE_EQUAL(mutCounter.getCount("ATC"), 1u);
}

BOOST_AUTO_TEST_CASE(test_writeEndMotifComparison)
{
  EndMotifCounter refCounter(1);
  refCounter.addMotif("A");
  refCounter.addMotif("C");
  EndMotifCounter mutCounter(1);
  mutCounter.addMotif("C");

  std::vector<EndMotifEntry> refProfile;
  std::vector<EndMotifEntry> mutProfile;
  std::vector<std::string>   missingMotifs;
  refCounter.getProfile(refProfile, missingMotifs);
  mutCounter.getProfile(mutProfile, missingMotifs);

  std::ostringstream oss;
  writeEndMotifComparison(oss, refProfile, mutProfile);
  BOOST_REQUIRE_EQUAL(
      oss.str(),
      "MOTIF\tCOUNT_REF\tFRACTION_REF\tCOUNT_MUT\tFRACTION_MUT\n"
      "A\t1\t0.5\t0\t0\n"
      "C\t1\t0.5\t1\t1\n"
      "G\t0\t0\t0\t0\n"
      "T\t0\t0\t0\t0\n");
}

BOOST_AUTO_TEST_SUITE_END()
