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

#include "CallTrinucleotide.hpp"
#include "CTOptions.hpp"

#include "blt_util/log.hpp"
#include "common/OutStream.hpp"
#include "fragsig/FastaReferenceAccessor.hpp"
#include "fragsig/InputTableReader.hpp"
#include "fragsig/ResultTableWriter.hpp"
#include "fragsig/TrinucleotideCaller.hpp"

#include <iostream>

static void getSpectrumFilter(const SpectrumOptions& opt, SpectrumFilter& filter)
{
  SUPPORT_TYPE::index_t supportType;
  for (const std::string& label : opt.excludeIfTypePresent) {
    if (SUPPORT_TYPE::parseLabel(label, supportType)) filter.excludeIfTypePresent.insert(supportType);
  }
  for (const std::string& label : opt.retainIfTypePresent) {
    if (SUPPORT_TYPE::parseLabel(label, supportType)) filter.retainIfTypePresent.insert(supportType);
  }
}

static SPECTRUM_SCALE::index_t getSpectrumScale(const SpectrumOptions& opt)
{
  if (opt.isNormalizeCountsPerStratum) return SPECTRUM_SCALE::STRATUM_FRACTION;
  if (opt.isNormalizeCounts) return SPECTRUM_SCALE::TOTAL_FRACTION;
  return SPECTRUM_SCALE::COUNT;
}

static void runCallTrinucleotide(const CTOptions& opt)
{
  // check that we have write permission on the output files early:
  OutStream consensusOuts(opt.consensusFilename);
  OutStream spectrumOuts(opt.spectrumFilename);

  RunStats   stats;
  LocusTable loci;
  readLocusTable(opt.inputOpt.locusFilename, loci, stats);

  FragmentStore fragments;
  readFragmentTable(opt.inputOpt.fragmentFilename, fragments);

  const FastaReferenceAccessor reference(opt.referenceFilename);

  SpectrumFilter spectrumFilter;
  getSpectrumFilter(opt.spectrumOpt, spectrumFilter);

  const TrinucleotideCaller caller(opt.consensusOpt, spectrumFilter, reference);

  std::vector<ConsensusRecord> records;
  SpectrumAggregator           spectrumAggregator;
  caller.call(fragments, loci, records, spectrumAggregator, stats);

  writeConsensusTable(consensusOuts.getStream(), records);

  std::vector<SpectrumEntry> spectrum;
  spectrumAggregator.getSpectrum(getSpectrumScale(opt.spectrumOpt), spectrum);
  writeSpectrumTable(spectrumOuts.getStream(), spectrum);

  log_os << "[INFO] Wrote " << records.size() << " consensus records to " << consensusOuts.getLabel()
         << " and the spectrum to " << spectrumOuts.getLabel() << "\n";

  log_os << "[INFO] Run statistics:\n";
  stats.report(log_os);

  if (!opt.statsFilename.empty()) {
    stats.save(opt.statsFilename.c_str());
  }
}

void CallTrinucleotide::runInternal(int argc, char* argv[]) const
{
  CTOptions opt;

  parseCTOptions(*this, argc, argv, opt);
  runCallTrinucleotide(opt);
}
