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
/// an efficient (and slightly unsafe) class for basic tab-delimited files, etc...
///
/// When a comment character is given, lines whose first word begins with it are skipped by
/// parse_line(), but still counted in line_no().
///

#pragma once

#include <iosfwd>

struct istream_line_splitter {
  istream_line_splitter(
      std::istream&  is,
      const unsigned line_buf_size  = 8 * 1024,
      const char     word_seperator = '\t',
      const unsigned max_word       = 0,
      const char     comment_char   = '\0')
    : _is(is),
      _line_no(0),
      _n_word(0),
      _buf_size(line_buf_size),
      _sep(word_seperator),
      _max_word(max_word),
      _comment(comment_char),
      _buf(new char[_buf_size])
  {
    if ((0 == _max_word) || (MAX_WORD_COUNT < _max_word)) {
      _max_word = MAX_WORD_COUNT;
    }
  }

  ~istream_line_splitter()
  {
    if (nullptr != _buf) {
      delete[] _buf;
      _buf = nullptr;
    }
  }

  istream_line_splitter(const istream_line_splitter&) = delete;
  istream_line_splitter& operator=(const istream_line_splitter&) = delete;

  /// number of words parsed from the current line, zero for an empty line
  unsigned n_word() const { return _n_word; }

  unsigned line_no() const { return _line_no; }

  /// parse the next non-comment line, returns false for regular end of input:
  bool parse_line();

  // recreates the line before parsing
  void write_line(std::ostream& os) const;

  // debug output, which provides line number and other info before calling write_line
  void dump(std::ostream& os) const;

  enum { MAX_WORD_COUNT = 50 };
  char* word[MAX_WORD_COUNT];

private:
  bool parse_next_line();

  bool is_comment_line() const { return ((_comment != '\0') && (_n_word > 0) && (word[0][0] == _comment)); }

  void increase_buffer_size();

  std::istream& _is;
  unsigned      _line_no;
  unsigned      _n_word;
  unsigned      _buf_size;
  char          _sep;
  unsigned      _max_word;
  char          _comment;
  char*         _buf;
};
