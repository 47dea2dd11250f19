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

#include "blt_util/known_pos_range2.hpp"

#include "boost/optional.hpp"

#include <iosfwd>
#include <string>

/// \brief GenomeInterval identifies a contiguous, right-open range on a named contig.
///
/// The contig name cannot be changed after construction. Intervals on different contigs never intersect.
struct GenomeInterval {
  GenomeInterval() : GenomeInterval("", 0, 0) {}

  /// \throws PreConditionException if endPos < beginPos
  GenomeInterval(const std::string& initContig, const pos_t beginPos, const pos_t endPos);

  GenomeInterval(const std::string& initContig, const known_pos_range2& initRange)
    : GenomeInterval(initContig, initRange.begin_pos(), initRange.end_pos())
  {
  }

  const std::string& contig() const { return _contig; }

  const known_pos_range2& range() const { return _range; }

  pos_t beginPos() const { return _range.begin_pos(); }

  pos_t endPos() const { return _range.end_pos(); }

  unsigned size() const { return _range.size(); }

  bool empty() const { return _range.empty(); }

  /// \brief Identify if this GenomeInterval overlaps another GenomeInterval
  ///
  /// 1. The contigs must be the same
  /// 2. The ranges must overlap by at least one position
  bool isIntersect(const GenomeInterval& gi) const
  {
    if (_contig != gi._contig) return false;
    return _range.is_range_intersect(gi._range);
  }

  /// does this interval completely contain gi?
  bool isSupersetOf(const GenomeInterval& gi) const
  {
    if (_contig != gi._contig) return false;
    return _range.is_superset_of(gi._range);
  }

  /// \return the overlapping part of this interval and gi, or nothing if they do not intersect
  boost::optional<GenomeInterval> intersect(const GenomeInterval& gi) const;

  bool operator<(const GenomeInterval& rhs) const
  {
    if (_contig < rhs._contig) return true;
    if (_contig == rhs._contig) {
      return (_range < rhs._range);
    }
    return false;
  }

  bool operator==(const GenomeInterval& rhs) const
  {
    return ((_contig == rhs._contig) && (_range == rhs._range));
  }

  bool operator!=(const GenomeInterval& rhs) const { return (!(*this == rhs)); }

private:
  std::string      _contig;
  known_pos_range2 _range;
};

/// Debug printer for genome interval, format is "contig:[begin,end)"
std::ostream& operator<<(std::ostream& os, const GenomeInterval& gi);
