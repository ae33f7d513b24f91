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

#include "CallMutantLength.hpp"
#include "CMLOptions.hpp"

#include "blt_util/log.hpp"
#include "common/OutStream.hpp"
#include "fragsig/FragmentLengthProfile.hpp"
#include "fragsig/InputTableReader.hpp"

#include <iostream>
#include <random>

static void runCallMutantLength(const CMLOptions& opt)
{
  // check that we have write permission on the output file early:
  OutStream outs(opt.outputFilename);

  RunStats   stats;
  LocusTable loci;
  readLocusTable(opt.inputOpt.locusFilename, loci, stats);

  FragmentStore fragments;
  readFragmentTable(opt.inputOpt.fragmentFilename, fragments);

  std::vector<FragmentLocusRow> joinedRows;
  joinFragmentsToLoci(fragments, loci, joinedRows, stats);

  const LengthProfileOptions& lengthOpt(opt.lengthOpt);
  if (lengthOpt.mode == LENGTH_PROFILE_MODE::DEFAULT) {
    std::vector<LengthHistogramEntry> histogram;
    std::vector<pos_t>                missingLengths;
    getFragmentLengthHistogram(
        joinedRows, lengthOpt.minFragmentLength, lengthOpt.maxFragmentLength, histogram, missingLengths);

    if (!missingLengths.empty()) {
      log_os << "[INFO] " << missingLengths.size()
             << " fragment lengths in range have no fragment and are reported with a count of 0:";
      for (const pos_t length : missingLengths) {
        log_os << " " << length;
      }
      log_os << "\n";
    }
    writeLengthHistogram(outs.getStream(), histogram);
  } else {
    static const bool                  isVerbose(false);
    std::vector<ResolvedFragmentLocus> resolvedRows;
    resolveFragmentLoci(joinedRows, isVerbose, resolvedRows, stats);

    std::mt19937                       rng(lengthOpt.deterministicSeed);
    std::vector<LengthComparisonEntry> comparison;
    getMutantLengthComparison(resolvedRows, lengthOpt.mode, rng, comparison);
    writeLengthComparison(outs.getStream(), comparison);
  }
  log_os << "[INFO] Wrote " << LENGTH_PROFILE_MODE::label(lengthOpt.mode) << " length profile to "
         << outs.getLabel() << "\n";

  log_os << "[INFO] Run statistics:\n";
  stats.report(log_os);
}

void CallMutantLength::runInternal(int argc, char* argv[]) const
{
  CMLOptions opt;

  parseCMLOptions(*this, argc, argv, opt);
  runCallMutantLength(opt);
}
