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
/// \brief Synthetic reference and alignments for pileup unit tests
///

#pragma once

#include "pileup/PileupAlignment.hpp"
#include "pileup/ReferenceBases.hpp"

#include <map>
#include <string>
#include <vector>

/// \brief Build a mapped alignment whose read agrees with reference except at the given positions
///
/// Read bases aligned to the reference are copied from reference, or taken from substitutions where the
/// reference position has an entry. Inserted and soft-clipped read bases are 'A'.
PileupAlignment buildTestAlignment(
    const std::string&           id,
    const ReferenceBases&        reference,
    const pos_t                  pos,
    const std::string&           cigar,
    const std::map<pos_t, char>& substitutions = std::map<pos_t, char>());

/// deterministic pseudo-random reference segment
ReferenceBases buildTestReference(const std::string& contig, const pos_t beginPos, const unsigned size);

/// \brief Reference for the chr17 scenario: chr17:[7500000,7501000), with 'C' at 7500764 and 'A' at
/// 7500763
const ReferenceBases& getScenarioReference();

/// the interval of the chr17 scenario alignments, chr17:[7500734,7500795)
GenomeInterval getScenarioInterval();

/// \brief Alignments for the chr17 scenario
///
/// 22 alignments carry a 'T' at 7500764, no alignment differs from the reference at 7500763, and fewer
/// than 60 read bases in the scenario interval differ from the reference in total. The set also includes
/// an unmapped read and reads outside of the scenario interval.
const std::vector<PileupAlignment>& getScenarioAlignments();

/// position of the shared variant in the chr17 scenario
const pos_t scenarioVariantPos = 7500764;

/// number of scenario alignments carrying the shared variant
const unsigned scenarioVariantReadCount = 22;
