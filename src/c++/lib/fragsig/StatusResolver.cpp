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

#include "fragsig/StatusResolver.hpp"

#include "blt_util/log.hpp"
#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

std::ostream& operator<<(std::ostream& os, const MateBases& mateBases)
{
  os << mateBases.mate1;
  if (mateBases.isPaired()) os << mateBases.mate2;
  return os;
}

static bool isMateBaseChar(const char c)
{
  switch (c) {
  case 'A':
  case 'C':
  case 'G':
  case 'T':
  case 'N':
  case refPlaceholderBase:
    return true;
  default:
    return false;
  }
}

bool parseMateBases(const std::string& locusInfo, MateBases& mateBases)
{
  if (locusInfo == "REF") {
    mateBases = MateBases(refPlaceholderBase);
    return true;
  }

  if (locusInfo.empty() || (locusInfo.size() > 2)) return false;
  for (const char c : locusInfo) {
    if (!isMateBaseChar(c)) return false;
  }

  mateBases = MateBases(locusInfo[0], ((locusInfo.size() == 2) ? locusInfo[1] : '\0'));
  return true;
}

MateBases substituteRefPlaceholder(const MateBases& raw, const char refBase)
{
  MateBases resolved(raw);
  if (resolved.mate1 == refPlaceholderBase) resolved.mate1 = refBase;
  if (resolved.mate2 == refPlaceholderBase) resolved.mate2 = refBase;
  return resolved;
}

MateBases getCallingMates(const MateBases& mateBases)
{
  if ((!mateBases.isPaired()) || mateBases.isConcordant()) return mateBases;
  if (mateBases.mate1 == 'N') return MateBases(mateBases.mate2);
  if (mateBases.mate2 == 'N') return MateBases(mateBases.mate1);
  return mateBases;
}

LOCUS_STATUS::index_t getLocusStatus(const MateBases& resolved, const char refBase, const char altBase)
{
  using namespace LOCUS_STATUS;

  const MateBases calling(getCallingMates(resolved));
  if (!calling.isConcordant()) return MUT_DISCORDANT;

  const char base(calling.mate1);
  if (calling.isPaired()) {
    if (base == refBase) return REF_CONCORDANT;
    if (base == altBase) return MUT_CONCORDANT;
    return OTHER_BASE_CONCORDANT;
  } else {
    if (base == refBase) return REF_SINGLE_READ;
    if (base == altBase) return MUT_SINGLE_READ;
    return OTHER_BASE_SINGLE_READ;
  }
}

void resolveFragmentLoci(
    const std::vector<FragmentLocusRow>& rows,
    const bool                           isVerbose,
    std::vector<ResolvedFragmentLocus>&  resolvedRows,
    RunStats&                            stats)
{
  resolvedRows.clear();
  resolvedRows.reserve(rows.size());

  for (const FragmentLocusRow& row : rows) {
    ResolvedFragmentLocus resolved;
    resolved.fragmentId     = row.fragmentId;
    resolved.fragmentLength = row.fragmentLength;
    resolved.fragmentPtr    = row.fragmentPtr;

    if (row.isOuterFragment()) {
      resolvedRows.push_back(resolved);
      continue;
    }

    const LocusAnnotation& annotation(*row.annotationPtr);
    if (row.locusPtr == nullptr) {
      stats.unresolvedLocusCount++;
      if (isVerbose) {
        log_os << __FUNCTION__ << ": Fragment '" << row.fragmentId << "' references locus "
               << annotation.locusKey << " which is absent from the locus table\n";
      }
      continue;
    }

    const Locus& locus(*row.locusPtr);
    MateBases    rawBases;
    if (!parseMateBases(annotation.locusInfo, rawBases)) {
      using namespace fragsig::common;
      std::ostringstream oss;
      oss << "Unexpected locus_info '" << annotation.locusInfo << "' for fragment '" << row.fragmentId
          << "' at locus " << locus.key;
      BOOST_THROW_EXCEPTION(InputFormatException(oss.str()));
    }

    resolved.locusPtr  = row.locusPtr;
    resolved.mateBases = getCallingMates(substituteRefPlaceholder(rawBases, locus.refBase));
    resolved.status    = getLocusStatus(resolved.mateBases, locus.refBase, locus.altBase);

    if (annotation.isUpstreamStatus && (annotation.upstreamStatus != resolved.status)) {
      stats.statusConflictCount++;
      if (isVerbose) {
        log_os << __FUNCTION__ << ": Fragment '" << row.fragmentId << "' at " << locus.getTargetKey()
               << " labeled '" << LOCUS_STATUS::label(annotation.upstreamStatus) << "' resolves to '"
               << LOCUS_STATUS::label(resolved.status) << "'\n";
      }
    }

    resolvedRows.push_back(resolved);
  }
}
