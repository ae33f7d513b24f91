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

#include "common/Program.hpp"

#include "boost/program_options.hpp"

#include <iosfwd>

/// print program usage with the given options description and exit with status 2
///
/// \param msg optional error message printed after the usage summary
void usage(
    std::ostream&                                      os,
    const fragsig::Program&                            prog,
    const boost::program_options::options_description& visible,
    const char*                                        msg = nullptr);
