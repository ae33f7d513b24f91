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

#pragma once

#include "common/Program.hpp"

/// Resolve a consensus mismatch at each candidate locus and tabulate the SBS96 spectrum
///
struct CallTrinucleotide : public fragsig::Program {
  const char* name() const override { return "CallTrinucleotide"; }

  const char* description() const override
  {
    return "resolve per-locus consensus mismatches of cfDNA fragments and tabulate their SBS96 spectrum";
  }

  void runInternal(int argc, char* argv[]) const override;
};
