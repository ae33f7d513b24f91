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

#include "CallEndMotif.hpp"
#include "CEMOptions.hpp"

#include "blt_util/log.hpp"
#include "common/OutStream.hpp"
#include "fragsig/FastaReferenceAccessor.hpp"
#include "fragsig/FragmentEndMotifProfile.hpp"
#include "fragsig/InputTableReader.hpp"

#include <iostream>

/// log motifs left out of, or zero-filled into, one profile
static void reportMotifIssues(
    const char* setLabel, const EndMotifCounter& counter, const std::vector<std::string>& missingMotifs)
{
  const auto& ambiguousCounts(counter.getAmbiguousMotifCounts());
  if (!ambiguousCounts.empty()) {
    log_os << "[INFO] Ambiguous " << setLabel
           << " end motifs with a base outside [ACGT], or clipped by a chromosome end, are removed:";
    for (const auto& motifCount : ambiguousCounts) {
      log_os << " '" << motifCount.first << "':" << motifCount.second;
    }
    log_os << "\n";
  }

  if (!missingMotifs.empty()) {
    log_os << "[INFO] " << missingMotifs.size() << " " << setLabel
           << " end motifs were not observed and are reported with a count of 0:";
    for (const std::string& motif : missingMotifs) {
      log_os << " " << motif;
    }
    log_os << "\n";
  }
}

static void runCallEndMotif(const CEMOptions& opt)
{
  // check that we have write permission on the output file early:
  OutStream outs(opt.outputFilename);

  const EndMotifOptions& motifOpt(opt.motifOpt);
  log_os << "[INFO] Extracting " << FRAGMENT_END::label(motifOpt.motifType) << motifOpt.motifLength
         << " end motifs from reference '" << opt.referenceFilename << "'\n";

  RunStats   stats;
  LocusTable loci;
  readLocusTable(opt.inputOpt.locusFilename, loci, stats);

  FragmentStore fragments;
  readFragmentTable(opt.inputOpt.fragmentFilename, fragments);

  std::vector<FragmentLocusRow> joinedRows;
  joinFragmentsToLoci(fragments, loci, joinedRows, stats);

  const FastaReferenceAccessor reference(opt.referenceFilename);
  std::vector<std::string>     missingMotifs;

  if (!motifOpt.isIntegrateMutant) {
    EndMotifCounter counter(motifOpt.motifLength);
    getEndMotifCounts(joinedRows, reference, motifOpt, counter);

    std::vector<EndMotifEntry> profile;
    counter.getProfile(profile, missingMotifs);
    reportMotifIssues("fragment", counter, missingMotifs);
    writeEndMotifProfile(outs.getStream(), profile);
  } else {
    static const bool                  isVerbose(false);
    std::vector<ResolvedFragmentLocus> resolvedRows;
    resolveFragmentLoci(joinedRows, isVerbose, resolvedRows, stats);

    EndMotifCounter refCounter(motifOpt.motifLength);
    EndMotifCounter mutCounter(motifOpt.motifLength);
    getEndMotifComparisonCounts(resolvedRows, reference, motifOpt, refCounter, mutCounter);

    std::vector<EndMotifEntry> refProfile;
    std::vector<EndMotifEntry> mutProfile;
    refCounter.getProfile(refProfile, missingMotifs);
    reportMotifIssues("reference fragment", refCounter, missingMotifs);
    mutCounter.getProfile(mutProfile, missingMotifs);
    reportMotifIssues("mutant fragment", mutCounter, missingMotifs);
    writeEndMotifComparison(outs.getStream(), refProfile, mutProfile);
  }
  log_os << "[INFO] Wrote end motif profile to " << outs.getLabel() << "\n";

  log_os << "[INFO] Run statistics:\n";
  stats.report(log_os);
}

void CallEndMotif::runInternal(int argc, char* argv[]) const
{
  CEMOptions opt;

  parseCEMOptions(*this, argc, argv, opt);
  runCallEndMotif(opt);
}
