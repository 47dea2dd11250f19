//
// Pileup - Genomic Read Pileup Track
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

#include "pileup/GenomeInterval.hpp"

#include <string>

/// \brief Convert a samtools-style region string into a GenomeInterval
///
/// Accepted forms are "contig:begin-end", with 1-indexed closed coordinates, and a bare "contig". A bare
/// contig name produces an interval extending to the maximum position, which should be clipped by the
/// caller to the known contig length. Contig names may themselves contain ':' characters.
///
/// \throws InvalidParameterException for an unparsable region
GenomeInterval convertSamtoolsRegionToGenomeInterval(const std::string& region);

/// Pretty print a genome interval in 1-indexed closed samtools-style region format for end-user messages
std::string getSamtoolsRegionString(const GenomeInterval& gi);
