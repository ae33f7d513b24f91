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

#include "blt_util/random_util.hpp"

template <typename T, typename RNG>
void SampleVector<T, RNG>::push(const T& val)
{
  if (_inputCount < _maxSize) {
    // initial fill of the reservoir array is deterministic:
    _data.push_back(val);
  } else if (_maxSize > 0) {
    // replace elements with gradually decreasing probability:
    const unsigned rval(get_uniform_index(_rng, _inputCount + 1));

    if (rval < _maxSize) {
      _data[rval] = val;
    }
  }
  _inputCount++;
}

template <typename T, typename RNG>
template <typename Iter>
void SampleVector<T, RNG>::push(Iter begin, const Iter end)
{
  for (; begin != end; ++begin) {
    push(*begin);
  }
}
