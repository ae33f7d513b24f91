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

#include "options/optionsUtil.hpp"
#include "test/testFileMakers.hpp"

#include "boost/filesystem.hpp"

BOOST_AUTO_TEST_SUITE(test_optionsUtil)

BOOST_AUTO_TEST_CASE(test_RequiredInputFilePath)
{
  std::string errorMsg;

  std::string emptyFilename;
  BOOST_REQUIRE(checkAndStandardizeRequiredInputFilePath(emptyFilename, "fragment", errorMsg));
  BOOST_REQUIRE_EQUAL(errorMsg, "Must specify fragment file");

  const TestFilenameMaker missingFile;
  std::string             missingFilename(missingFile.getFilename());
  BOOST_REQUIRE(checkAndStandardizeRequiredInputFilePath(missingFilename, "fragment", errorMsg));

  const TestTextFileMaker inputFile("chrom\tpos\tref\talt\n");
  std::string             inputFilename(inputFile.getFilename());
  BOOST_REQUIRE(!checkAndStandardizeRequiredInputFilePath(inputFilename, "locus", errorMsg));
  BOOST_REQUIRE(errorMsg.empty());
  BOOST_REQUIRE(boost::filesystem::path(inputFilename).is_absolute());
}

BOOST_AUTO_TEST_CASE(test_RequiredOutputFilePath)
{
  std::string errorMsg;
  BOOST_REQUIRE(checkRequiredOutputFilePath("", "consensus", errorMsg));

  const TestFilenameMaker outputFile;
  BOOST_REQUIRE(!checkRequiredOutputFilePath(outputFile.getFilename(), "consensus", errorMsg));

  const std::string badDirFilename((boost::filesystem::path(outputFile.getFilename()) / "out.tsv").string());
  BOOST_REQUIRE(checkRequiredOutputFilePath(badDirFilename, "consensus", errorMsg));
}

BOOST_AUTO_TEST_SUITE_END()
