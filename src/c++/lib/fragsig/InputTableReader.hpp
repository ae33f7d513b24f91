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
/// \brief Readers for the tab-delimited locus and fragment tables
///
/// Empty lines and lines starting with '#' are skipped in both tables. Malformed rows are fatal
/// input errors.
///

#pragma once

#include "fragsig/FragmentStore.hpp"
#include "fragsig/LocusTable.hpp"
#include "fragsig/RunStats.hpp"

#include <iosfwd>
#include <string>

/// \brief Read locus table rows "chrom pos ref alt", additional columns are ignored
///
/// When a locus key repeats, the first row is kept and the repeat is counted as a duplicate locus.
///
/// \param[in] streamLabel name of the input used in error messages
void readLocusTable(std::istream& is, const char* streamLabel, LocusTable& loci, RunStats& stats);

void readLocusTable(const std::string& filename, LocusTable& loci, RunStats& stats);

/// \brief Read fragment table rows
///
/// Each row is "fragment_id chrom start end strand locus_key locus_info locus_status". A fragment with
/// no locus annotation has '.' in the last three columns, and locus_status may be '.' where the
/// upstream step did not label a pair. Rows with identical fragment_id values are accumulated onto a
/// single fragment, they must agree on the fragment interval.
void readFragmentTable(std::istream& is, const char* streamLabel, FragmentStore& fragments);

void readFragmentTable(const std::string& filename, FragmentStore& fragments);
