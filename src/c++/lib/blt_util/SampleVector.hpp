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
/// \author Chris Saunders
///

#pragma once

#include <vector>

/// random sub-sampling array
///
/// This array holds at most S objects, with S fixed at instantiation time. The array accepts N input
/// objects. For N<=S, the array contains every input object in input order. For any N>S, the array
/// contains a given input object with probability S/N.
///
/// This behavior is implemented via standard reservoir sampling, so the sample is drawn without
/// replacement.
///
template <typename T, typename RNG>
struct SampleVector {
  /// \param initrng c++11 <random> rng generator, see std::shuffle for detailed doc of similar parameter
  SampleVector(const unsigned initSize, RNG& initRng) : _inputCount(0), _maxSize(initSize), _rng(initRng)
  {
    _data.reserve(_maxSize);
  }

  void push(const T& val);

  /// push every object in [begin,end) in order
  template <typename Iter>
  void push(Iter begin, const Iter end);

  /// true if more objects were pushed than the reservoir can hold
  bool isDownsampled() const { return (_inputCount > _maxSize); }

  /// total number of objects pushed into the array
  unsigned inputCount() const { return _inputCount; }

  const std::vector<T>& data() const { return _data; }

private:
  unsigned       _inputCount;
  unsigned       _maxSize;
  std::vector<T> _data;
  RNG&           _rng;
};

#include "SampleVectorImpl.hpp"
