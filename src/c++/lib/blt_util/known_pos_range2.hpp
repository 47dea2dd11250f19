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

#include "blt_util/blt_types.hpp"

#include "boost/optional.hpp"

#include <algorithm>
#include <iosfwd>

/// \brief integer ranges which are right open
///
struct known_pos_range2 {
  known_pos_range2() : known_pos_range2(0, 0) {}

  known_pos_range2(const pos_t bp, const pos_t ep) : _begin_pos(bp), _end_pos(ep) {}

  void set_begin_pos(const pos_t pos) { _begin_pos = pos; }

  void set_end_pos(const pos_t pos) { _end_pos = pos; }

  pos_t begin_pos() const { return _begin_pos; }

  pos_t end_pos() const { return _end_pos; }

  bool empty() const { return (_end_pos <= _begin_pos); }

  bool is_pos_intersect(const pos_t pos) const { return ((pos >= _begin_pos) && (pos < _end_pos)); }

  /// empty ranges never intersect anything
  bool is_range_intersect(const known_pos_range2& pr) const
  {
    return ((pr._end_pos > _begin_pos) && (pr._begin_pos < _end_pos) && (!empty()) && (!pr.empty()));
  }

  /// does this range completely overlap pr?
  bool is_superset_of(const known_pos_range2& pr) const
  {
    return ((pr._end_pos <= _end_pos) && (pr._begin_pos >= _begin_pos));
  }

  unsigned size() const { return std::max(0, _end_pos - _begin_pos); }

  bool operator<(const known_pos_range2& rhs) const
  {
    if (_begin_pos < rhs._begin_pos) return true;
    if (_begin_pos != rhs._begin_pos) return false;
    return (_end_pos < rhs._end_pos);
  }

  bool operator==(const known_pos_range2& rhs) const
  {
    return ((_begin_pos == rhs._begin_pos) && (_end_pos == rhs._end_pos));
  }

  bool operator!=(const known_pos_range2& rhs) const { return (!(*this == rhs)); }

  // expand range to extend of a second range:
  void merge_range(const known_pos_range2& kpr)
  {
    if (kpr._begin_pos < _begin_pos) _begin_pos = kpr._begin_pos;
    if (kpr._end_pos > _end_pos) _end_pos = kpr._end_pos;
  }

  void clear()
  {
    _begin_pos = 0;
    _end_pos   = 0;
  }

private:
  pos_t _begin_pos;
  pos_t _end_pos;
};

/// return the overlapping part of two ranges, or nothing if they do not intersect
inline boost::optional<known_pos_range2> intersect_range(
    const known_pos_range2& kpr1, const known_pos_range2& kpr2)
{
  if (!kpr1.is_range_intersect(kpr2)) return boost::none;
  return known_pos_range2(
      std::max(kpr1.begin_pos(), kpr2.begin_pos()), std::min(kpr1.end_pos(), kpr2.end_pos()));
}

std::ostream& operator<<(std::ostream& os, const known_pos_range2& pr);
