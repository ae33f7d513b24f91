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

#include <string>

/// \brief Check that a required input file exists, and if so convert it to an absolute path
///
/// \param[out] errorMsg If an error occurs this is set to an end-user targeted error message. Any string
/// content on input is cleared
///
/// \return True if an error occurs
bool checkAndStandardizeRequiredInputFilePath(
    std::string& filename, const char* fileLabel, std::string& errorMsg);

/// \brief Check that a required output file has been specified and that its parent directory exists
///
/// \return True if an error occurs
bool checkRequiredOutputFilePath(const std::string& filename, const char* fileLabel, std::string& errorMsg);
