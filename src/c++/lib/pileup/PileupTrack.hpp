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

#include "pileup/AlignmentCache.hpp"
#include "pileup/MismatchDetector.hpp"
#include "pileup/PileupLayout.hpp"
#include "pileup/ReferenceCache.hpp"
#include "pileup/RenderRecord.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>

/// which data feeds are available over the visible interval
namespace TRACK_STATE {
enum index_t { WAITING_BOTH, HAVE_REFERENCE_ONLY, HAVE_ALIGNMENTS_ONLY, READY };

inline const char* label(const index_t i)
{
  switch (i) {
  case WAITING_BOTH:
    return "waiting_both";
  case HAVE_REFERENCE_ONLY:
    return "have_reference_only";
  case HAVE_ALIGNMENTS_ONLY:
    return "have_alignments_only";
  case READY:
    return "ready";
  default:
    return "unknown";
  }
}

inline index_t getState(const bool isReference, const bool isAlignment)
{
  if (isReference) return (isAlignment ? READY : HAVE_REFERENCE_ONLY);
  return (isAlignment ? HAVE_ALIGNMENTS_ONLY : WAITING_BOTH);
}
}  // namespace TRACK_STATE

/// \brief Reconciles the reference and alignment feeds of one visible interval into render records
///
/// The track owns one reference cache and one alignment cache. Each cache update recomputes the render
/// set: reference records for every cached reference position in the visible interval, then one pileup
/// record for each cached alignment in the visible interval. Rows are assigned incrementally, so an
/// alignment keeps its row as more alignments arrive. Mismatches are computed only when both feeds are
/// available. The renderer is called once for each update which changes the render set or the track state.
///
/// Reference is requested over a reference window rather than the visible interval alone. The window
/// starts as the visible interval widened out to referenceBlockSize boundaries, and is widened further
/// (again on block boundaries) whenever an alignment in view extends past it, so that mismatches outside
/// the visible interval can be resolved. Detection is repeated for an alignment only when reference has
/// arrived over one of its pending ranges.
///
/// Fetch completions which arrive after the track is destroyed are dropped.
class PileupTrack : public CacheObserver {
public:
  typedef std::function<void(const RenderSet&)> renderer_t;

  static const pos_t referenceBlockSize = 1000;

  /// \param[in] isContainedOnly show only alignments fully inside the visible interval
  PileupTrack(
      const GenomeInterval& visibleInterval,
      ReferenceSource&      referenceSource,
      AlignmentSource&      alignmentSource,
      renderer_t            renderer,
      const bool            isContainedOnly = false);

  /// request reference for the reference window and alignments for the visible interval
  ///
  /// Any part which is already cached or in flight is not fetched again, so this is also the way to retry
  /// after a failed fetch.
  void requestData();

  /// discard all row assignments and lay out every alignment again from scratch
  void resetLayout();

  TRACK_STATE::index_t getState() const { return _state; }

  /// the most recently emitted render set
  const RenderSet& getRenderSet() const { return _renderSet; }

  unsigned getEmissionCount() const { return _emissionCount; }

  const GenomeInterval& getVisibleInterval() const { return _visibleInterval; }

  /// the span reference has been requested for
  const GenomeInterval& getReferenceWindow() const { return _referenceWindow; }

  /// number of times mismatch detection has been run on any alignment
  unsigned getDetectionCount() const { return _detectionCount; }

  unsigned getRowCount() const { return _layout.getRowCount(); }

  const ReferenceCache& getReferenceCache() const { return *_referenceCache; }

  const AlignmentCache& getAlignmentCache() const { return *_alignmentCache; }

private:
  void receive_notification(const CacheNotifier&, const CacheUpdate&) override;

  /// recompute the render set, and emit it if anything changed
  void update();

  void addReferenceRecords(RenderSet& renderSet) const;

  void addPileupRecords(const bool isReference, RenderSet& renderSet);

  /// widen the reference window to cover every alignment in view, and request any new part
  void extendReferenceWindow(const std::vector<const PileupAlignment*>& alignments);

  void updateMismatches(const std::vector<const PileupAlignment*>& alignments);

  /// true if no result exists for the alignment yet, or reference has arrived over a pending range
  bool isDetectionNeeded(const PileupAlignment& alignment) const;

  const GenomeInterval _visibleInterval;
  GenomeInterval       _referenceWindow;
  const bool           _isContainedOnly;
  renderer_t           _renderer;

  std::shared_ptr<ReferenceCache> _referenceCache;
  std::shared_ptr<AlignmentCache> _alignmentCache;

  PileupLayout                          _layout;
  std::map<std::string, MismatchResult> _mismatches;

  TRACK_STATE::index_t _state = TRACK_STATE::WAITING_BOTH;
  RenderSet            _renderSet;
  unsigned             _emissionCount  = 0;
  unsigned             _detectionCount = 0;
};
