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
/// \brief Portable uniform draws from a standard random engine
///

#pragma once

#include <cassert>
#include <cstdint>

/// \brief Draw an index uniformly from [0,size)
///
/// The standard library distributions are free to map engine output to values in any way, so the same
/// seed can give different draws under different standard library implementations. This function only
/// depends on the raw engine output, which is fully specified for the standard engines. Engine output
/// above the largest multiple of \p size is rejected and drawn again, so every index is equally likely.
///
/// \param[in] size must be greater than zero
template <typename RNG>
unsigned get_uniform_index(RNG& rng, const unsigned size)
{
  static_assert((RNG::max() - RNG::min()) < UINT64_MAX, "engine range must be smaller than 2^64");
  assert(size > 0);
  const uint64_t engineRange(static_cast<uint64_t>(RNG::max() - RNG::min()) + 1);
  const uint64_t acceptLimit(engineRange - (engineRange % size));
  while (true) {
    const uint64_t val(static_cast<uint64_t>(rng() - RNG::min()));
    if (val < acceptLimit) return static_cast<unsigned>(val % size);
  }
}
