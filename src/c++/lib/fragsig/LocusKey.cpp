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

#include "fragsig/LocusKey.hpp"

#include "blt_util/blt_exception.hpp"
#include "blt_util/parse_util.hpp"

#include "boost/functional/hash.hpp"

#include <iostream>

std::size_t LocusKeyHash::operator()(const LocusKey& key) const
{
  std::size_t seed(0);
  boost::hash_combine(seed, key.chrom);
  boost::hash_combine(seed, key.pos);
  return seed;
}

bool parseLocusKey(const std::string& str, LocusKey& key)
{
  const std::string::size_type sep(str.rfind(':'));
  if ((sep == std::string::npos) || (sep == 0) || ((sep + 1) == str.size())) return false;

  try {
    key.pos = fragsig::blt_util::parse_int_str(str.substr(sep + 1));
  } catch (const blt_exception&) {
    return false;
  }
  if (key.pos < 1) return false;
  key.chrom = str.substr(0, sep);
  return true;
}

std::ostream& operator<<(std::ostream& os, const LocusKey& key)
{
  os << key.chrom << ':' << key.pos;
  return os;
}

std::ostream& operator<<(std::ostream& os, const TargetKey& key)
{
  os << key.locus << ':' << key.refBase << ':' << key.altBase;
  return os;
}
