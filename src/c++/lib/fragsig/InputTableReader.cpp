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
///

#include "fragsig/InputTableReader.hpp"

#include "blt_util/blt_exception.hpp"
#include "blt_util/istream_line_splitter.hpp"
#include "blt_util/log.hpp"
#include "blt_util/parse_util.hpp"
#include "blt_util/seq_util.hpp"
#include "common/Exceptions.hpp"
#include "fragsig/StatusResolver.hpp"

#include <cstring>

#include <fstream>
#include <iostream>
#include <sstream>

static const char naField[] = ".";

static void throwRowError(
    const char* streamLabel, const istream_line_splitter& dparse, const std::string& msg)
{
  using namespace fragsig::common;

  std::ostringstream oss;
  oss << "Unexpected format in '" << streamLabel << "' line " << dparse.line_no() << ": " << msg << "\n";
  dparse.dump(oss);
  BOOST_THROW_EXCEPTION(
      InputFormatException(oss.str()) << InputSource(streamLabel) << InputLineNumber(dparse.line_no()));
}

static const char tableCommentChar('#');

static bool isSkippedLine(const istream_line_splitter& dparse) { return (dparse.n_word() == 0); }

static pos_t parsePosition(const char* streamLabel, const istream_line_splitter& dparse, const char* field)
{
  int pos(0);
  try {
    pos = fragsig::blt_util::parse_int_rvalue(field);
  } catch (const blt_exception& e) {
    throwRowError(streamLabel, dparse, e.what());
  }
  if (pos < 1) {
    throwRowError(streamLabel, dparse, std::string("position is not positive: '") + field + "'");
  }
  return pos;
}

static char parseLocusBase(const char* streamLabel, const istream_line_splitter& dparse, const char* field)
{
  if ((strlen(field) != 1) || (!is_iupac_base(field[0]))) {
    throwRowError(streamLabel, dparse, std::string("invalid locus base: '") + field + "'");
  }
  return field[0];
}

static void openInputFile(const std::string& filename, const char* label, std::ifstream& ifs)
{
  ifs.open(filename.c_str());
  if (!ifs) {
    using namespace fragsig::common;
    std::ostringstream oss;
    oss << "Can't open " << label << " file: '" << filename << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }
}

void readLocusTable(std::istream& is, const char* streamLabel, LocusTable& loci, RunStats& stats)
{
  enum { CHROM, POS, REF, ALT, SIZE };

  istream_line_splitter dparse(is, 8 * 1024, '\t', 0, tableCommentChar);
  while (dparse.parse_line()) {
    if (isSkippedLine(dparse)) continue;
    if (dparse.n_word() < SIZE) {
      throwRowError(streamLabel, dparse, "expected chrom, pos, ref and alt columns");
    }

    const Locus locus(
        LocusKey(dparse.word[CHROM], parsePosition(streamLabel, dparse, dparse.word[POS])),
        parseLocusBase(streamLabel, dparse, dparse.word[REF]),
        parseLocusBase(streamLabel, dparse, dparse.word[ALT]));

    if (!loci.addLocus(locus)) {
      stats.duplicateLocusCount++;
      std::ostringstream oss;
      oss << "WARNING: Duplicate loci found in locus table '" << streamLabel
          << "', only the first row for each locus is used. First duplicate: " << locus << "\n";
      warnOnce(oss.str());
    }
  }
  stats.locusCount = loci.size();
}

void readLocusTable(const std::string& filename, LocusTable& loci, RunStats& stats)
{
  std::ifstream ifs;
  openInputFile(filename, "locus table", ifs);
  readLocusTable(ifs, filename.c_str(), loci, stats);
}

void readFragmentTable(std::istream& is, const char* streamLabel, FragmentStore& fragments)
{
  enum { FRAGMENT_ID, CHROM, START, END, STRAND, LOCUS_KEY, LOCUS_INFO, LOCUS_STATUS, SIZE };

  istream_line_splitter dparse(is, 8 * 1024, '\t', 0, tableCommentChar);
  while (dparse.parse_line()) {
    if (isSkippedLine(dparse)) continue;
    if (dparse.n_word() < SIZE) {
      throwRowError(streamLabel, dparse, "expected 8 columns");
    }

    const pos_t beginPos(parsePosition(streamLabel, dparse, dparse.word[START]));
    const pos_t endPos(parsePosition(streamLabel, dparse, dparse.word[END]));
    if (endPos < beginPos) {
      throwRowError(streamLabel, dparse, "fragment end precedes start");
    }

    const char* strandField(dparse.word[STRAND]);
    if ((strlen(strandField) != 1) || (strchr("+-*", strandField[0]) == nullptr)) {
      throwRowError(streamLabel, dparse, std::string("invalid strand: '") + strandField + "'");
    }

    bool           isNew(false);
    const unsigned fragmentIndex(fragments.addFragment(
        dparse.word[FRAGMENT_ID], dparse.word[CHROM], beginPos, endPos, strandField[0], isNew));
    if (!isNew) {
      const Fragment& fragment(fragments.getFragments()[fragmentIndex]);
      if ((fragment.chrom != dparse.word[CHROM]) || (fragment.beginPos != beginPos) ||
          (fragment.endPos != endPos)) {
        throwRowError(streamLabel, dparse, "fragment interval differs from an earlier row with the same id");
      }
    }

    if (0 == strcmp(dparse.word[LOCUS_KEY], naField)) continue;

    LocusAnnotation annotation;
    if (!parseLocusKey(dparse.word[LOCUS_KEY], annotation.locusKey)) {
      throwRowError(streamLabel, dparse, std::string("invalid locus key: '") + dparse.word[LOCUS_KEY] + "'");
    }

    annotation.locusInfo = dparse.word[LOCUS_INFO];
    MateBases mateBases;
    if (!parseMateBases(annotation.locusInfo, mateBases)) {
      throwRowError(streamLabel, dparse, "invalid locus_info: '" + annotation.locusInfo + "'");
    }

    const char* statusField(dparse.word[LOCUS_STATUS]);
    if (0 != strcmp(statusField, naField)) {
      if (!LOCUS_STATUS::parseLabel(statusField, annotation.upstreamStatus)) {
        throwRowError(streamLabel, dparse, std::string("invalid locus_status: '") + statusField + "'");
      }
      annotation.isUpstreamStatus = true;
    }

    fragments.addAnnotation(fragmentIndex, annotation);
  }
}

void readFragmentTable(const std::string& filename, FragmentStore& fragments)
{
  std::ifstream ifs;
  openInputFile(filename, "fragment table", ifs);
  readFragmentTable(ifs, filename.c_str(), fragments);
}
