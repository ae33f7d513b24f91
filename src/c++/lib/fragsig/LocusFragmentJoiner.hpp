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
/// \brief Join fragment locus annotations to the locus table
///

#pragma once

#include "blt_util/blt_types.hpp"
#include "fragsig/FragmentStore.hpp"
#include "fragsig/LocusTable.hpp"
#include "fragsig/RunStats.hpp"

#include <string>
#include <vector>

/// \brief One (fragment, locus) overlap, or a fragment overlapping no locus
///
/// Pointers refer into the FragmentStore and LocusTable supplied to the join, which must outlive the
/// row.
struct FragmentLocusRow {
  /// true for a fragment retained without any locus annotation
  bool isOuterFragment() const { return (annotationPtr == nullptr); }

  /// logical fragment identifier
  std::string fragmentId;

  pos_t fragmentLength = 0;

  /// retained fragment carrying the logical identifier
  const Fragment* fragmentPtr = nullptr;

  /// nullptr for outer fragments, or where the annotated locus is absent from the locus table
  const Locus* locusPtr = nullptr;

  /// nullptr for outer fragments
  const LocusAnnotation* annotationPtr = nullptr;
};

/// \brief Produce one row per fragment-locus overlap, and one row per fragment without an overlap
///
/// Fragments are de-duplicated on their logical identifier (see getLogicalFragmentId), the first
/// fragment seen for each identifier is retained. Repeated annotations of the same locus on a single
/// fragment are also collapsed to the first one.
///
/// Rows are produced in fragment store order.
void joinFragmentsToLoci(
    const FragmentStore&           fragments,
    const LocusTable&              loci,
    std::vector<FragmentLocusRow>& rows,
    RunStats&                      stats);
