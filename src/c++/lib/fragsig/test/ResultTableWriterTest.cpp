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

#include "fragsig/ResultTableWriter.hpp"

#include <sstream>

BOOST_AUTO_TEST_SUITE(test_ResultTableWriter)

static const char consensusHeader[] =
    "target_mutation\tCO_MUT\tSO_MUT\tCO_REF\tSO_REF\tDO\tSO_OTHER\tCO_OTHER"
    "\tCO_MUT_flength\tSO_MUT_flength\tCO_REF_flength\tSO_REF_flength\tDO_flength\tSO_OTHER_flength"
    "\tCO_OTHER_flength\tconsensus_mismatch\tSBS96\n";

static ConsensusRecord makeRecord()
{
  ConsensusRecord record;
  LocusConsensus& consensus(record.consensus);
  consensus.locus                                    = Locus(LocusKey("chr1", 1000000), 'C', 'T');
  consensus.tally.counts[SUPPORT_TYPE::CO_MUT]       = 2;
  consensus.tally.medianLength[SUPPORT_TYPE::CO_MUT] = 166.5;
  consensus.tally.counts[SUPPORT_TYPE::CO_REF]       = 1;
  consensus.tally.medianLength[SUPPORT_TYPE::CO_REF] = 170;
  consensus.state                                    = CONSENSUS_STATE::FINALIZED;
  consensus.category                                 = SUPPORT_TYPE::CO_MUT;
  consensus.consensusBase                            = 'T';
  return record;
}

BOOST_AUTO_TEST_CASE(test_ConsensusTableWithChannel)
{
  std::vector<ConsensusRecord> records(1, makeRecord());
  records[0].trinucStatus = TRINUC_STATUS::OK;
  records[0].channel      = Sbs96Channel('A', 'C', 'T', 'G');

  std::ostringstream oss;
  writeConsensusTable(oss, records);

  const std::string expected(
      std::string(consensusHeader) +
      "chr1:1000000:C:T\t2\t0\t1\t0\t0\t0\t0\t166.5\tNA\t170\tNA\tNA\tNA\tNA\tchr1:1000000:T:CO_MUT"
      "\tA[C>T]G\n");
  BOOST_REQUIRE_EQUAL(oss.str(), expected);
}

BOOST_AUTO_TEST_CASE(test_ConsensusTableWithoutChannel)
{
  std::vector<ConsensusRecord> records(1, makeRecord());
  records[0].trinucStatus = TRINUC_STATUS::AMBIGUOUS_BASE;

  std::ostringstream oss;
  writeConsensusTable(oss, records);

  const std::string table(oss.str());
  BOOST_REQUIRE(table.find("\tchr1:1000000:T:CO_MUT\tNA\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_EmptyConsensusTable)
{
  std::ostringstream oss;
  writeConsensusTable(oss, std::vector<ConsensusRecord>());
  BOOST_REQUIRE_EQUAL(oss.str(), consensusHeader);
}

BOOST_AUTO_TEST_CASE(test_SpectrumTable)
{
  std::vector<SpectrumEntry> spectrum(2);
  spectrum[0].channel     = Sbs96Channel('T', 'C', 'A', 'T');
  spectrum[0].overlapType = OVERLAP_TYPE::CO_MUT;
  spectrum[0].value       = 3;
  spectrum[1].channel     = Sbs96Channel('A', 'T', 'G', 'C');
  spectrum[1].overlapType = OVERLAP_TYPE::DO;
  spectrum[1].value       = 0.25;

  std::ostringstream oss;
  writeSpectrumTable(oss, spectrum);
  BOOST_REQUIRE_EQUAL(oss.str(), "SBS\toverlap_type\tvalue\nT[C>A]T\tCO_MUT\t3\nA[T>G]C\tDO\t0.25\n");
}

BOOST_AUTO_TEST_SUITE_END()
