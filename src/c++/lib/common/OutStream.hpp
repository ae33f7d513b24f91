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
/// \author Chris Saunders
///

#pragma once

#include <iosfwd>
#include <memory>
#include <string>

/// \brief Output stream which writes to a file, or to stdout if the filename is empty or "-"
///
/// The file is opened once in the constructor to fail early when it is not writable, and then
/// re-opened lazily on the first call to getStream().
struct OutStream {
  explicit OutStream(const std::string& fileName);

  ~OutStream();

  OutStream(const OutStream&) = delete;
  OutStream& operator=(const OutStream&) = delete;

  std::ostream& getStream()
  {
    if (!_isInit) initStream();
    return *_osptr;
  }

  /// "stdout" when writing to stdout
  const std::string& getLabel() const { return _label; }

private:
  bool isStdout() const { return (_fileName.empty() || (_fileName == "-")); }

  void initStream();

  static void openFile(const std::string& filename, std::ofstream& ofs);

  bool                           _isInit;
  const std::string              _fileName;
  const std::string              _label;
  std::ostream*                  _osptr;
  std::unique_ptr<std::ofstream> _ofsptr;
};
