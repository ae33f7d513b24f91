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

#include "fragsig/RunStats.hpp"

#include "common/OutStream.hpp"

#include <iostream>

void RunStats::merge(const RunStats& rhs)
{
  locusCount += rhs.locusCount;
  duplicateLocusCount += rhs.duplicateLocusCount;
  fragmentCount += rhs.fragmentCount;
  duplicateFragmentCount += rhs.duplicateFragmentCount;
  duplicateAnnotationCount += rhs.duplicateAnnotationCount;
  outerFragmentCount += rhs.outerFragmentCount;
  fragmentLocusPairCount += rhs.fragmentLocusPairCount;
  unresolvedLocusCount += rhs.unresolvedLocusCount;
  statusConflictCount += rhs.statusConflictCount;
  noSupportLocusCount += rhs.noSupportLocusCount;
  consensusRecordCount += rhs.consensusRecordCount;
  ambiguousBaseCount += rhs.ambiguousBaseCount;
  nonSubstitutionCount += rhs.nonSubstitutionCount;
  referenceMismatchCount += rhs.referenceMismatchCount;
  spectrumFilteredCount += rhs.spectrumFilteredCount;
  spectrumRecordCount += rhs.spectrumRecordCount;
}

void RunStats::report(std::ostream& os) const
{
  static const char sep('\t');
  os << "locusCount" << sep << locusCount << "\n"
     << "duplicateLocusCount" << sep << duplicateLocusCount << "\n"
     << "fragmentCount" << sep << fragmentCount << "\n"
     << "duplicateFragmentCount" << sep << duplicateFragmentCount << "\n"
     << "duplicateAnnotationCount" << sep << duplicateAnnotationCount << "\n"
     << "outerFragmentCount" << sep << outerFragmentCount << "\n"
     << "fragmentLocusPairCount" << sep << fragmentLocusPairCount << "\n"
     << "unresolvedLocusCount" << sep << unresolvedLocusCount << "\n"
     << "statusConflictCount" << sep << statusConflictCount << "\n"
     << "noSupportLocusCount" << sep << noSupportLocusCount << "\n"
     << "consensusRecordCount" << sep << consensusRecordCount << "\n"
     << "ambiguousBaseCount" << sep << ambiguousBaseCount << "\n"
     << "nonSubstitutionCount" << sep << nonSubstitutionCount << "\n"
     << "referenceMismatchCount" << sep << referenceMismatchCount << "\n"
     << "spectrumFilteredCount" << sep << spectrumFilteredCount << "\n"
     << "spectrumRecordCount" << sep << spectrumRecordCount << "\n";
}

void RunStats::save(const char* filename) const
{
  OutStream outs(filename);
  report(outs.getStream());
}
