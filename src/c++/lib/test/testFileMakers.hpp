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
/// \brief Utility functions to create temporary files for unit testing
/// \author Trevor Ramsay
///

#pragma once

#include <string>

/// Provide access to temporary file and limit lifetime of the temporary file to the object filetime
///
/// This object should not be directly instantiated by client code.
struct TestFileMakerBase {
  ~TestFileMakerBase();

  const std::string& getFilename() const { return _tempFilename; }

protected:
  // don't allow this to be directly instantiated:
  TestFileMakerBase() = default;

  std::string _tempFilename;
};

/// \brief Get a non-existing temporary file name
///
/// If the temporary file name exists in the filesystem, it will be deleted when this object goes out of
/// scope.
struct TestFilenameMaker : public TestFileMakerBase {
  TestFilenameMaker();
};

/// \brief Write the given text to a temporary file for test purposes.
///
/// The temporary file will be deleted when this object goes out of scope.
struct TestTextFileMaker : public TestFileMakerBase {
  explicit TestTextFileMaker(const std::string& content);
};

/// \brief Write a single-contig FASTA file to a temporary file for test purposes.
///
/// The sequence is wrapped at 60 bases per line. The temporary file and any faidx index created beside it
/// are deleted when this object goes out of scope.
struct TestFastaFileMaker : public TestFileMakerBase {
  TestFastaFileMaker(const std::string& chrom, const std::string& seq);
  ~TestFastaFileMaker();
};
