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

/// \brief Parameters of the per-locus consensus calls
///
struct ConsensusOptions {
  /// Seeds every randomized tie-break. Each locus draws from its own generator seeded from this value and
  /// the locus ordinal, so results do not depend on workerThreadCount. Draws are taken from the raw
  /// std::mt19937 output, so a seed also gives the same results under any standard library.
  unsigned deterministicSeed = 123;

  /// Number of locus shards processed concurrently
  unsigned workerThreadCount = 1;

  /// Log each skipped or flagged record
  bool isVerbose = false;
};
