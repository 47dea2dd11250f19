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

#include "pileup/PileupTrack.hpp"

const pos_t PileupTrack::referenceBlockSize;

/// widen range out to the enclosing multiples of blockSize
static known_pos_range2 getBlockRange(const known_pos_range2& range, const pos_t blockSize)
{
  const pos_t beginPos((range.begin_pos() / blockSize) * blockSize);
  const pos_t endPos(((range.end_pos() + blockSize - 1) / blockSize) * blockSize);
  return known_pos_range2(beginPos, endPos);
}

PileupTrack::PileupTrack(
    const GenomeInterval& visibleInterval,
    ReferenceSource&      referenceSource,
    AlignmentSource&      alignmentSource,
    renderer_t            renderer,
    const bool            isContainedOnly)
  : _visibleInterval(visibleInterval),
    _referenceWindow(visibleInterval.contig(), getBlockRange(visibleInterval.range(), referenceBlockSize)),
    _isContainedOnly(isContainedOnly),
    _renderer(std::move(renderer)),
    _referenceCache(ReferenceCache::create(referenceSource)),
    _alignmentCache(AlignmentCache::create(alignmentSource))
{
  observe_notifier(*_referenceCache);
  observe_notifier(*_alignmentCache);
}

void PileupTrack::requestData()
{
  _referenceCache->request(_referenceWindow);
  _alignmentCache->request(_visibleInterval, _isContainedOnly);
}

void PileupTrack::resetLayout()
{
  _layout.clear();
  update();
}

void PileupTrack::receive_notification(const CacheNotifier&, const CacheUpdate& cacheUpdate)
{
  const bool isReferenceFeed(cacheUpdate.feed == CACHE_FEED::REFERENCE);
  if (!cacheUpdate.interval.isIntersect(isReferenceFeed ? _referenceWindow : _visibleInterval)) return;
  update();
}

void PileupTrack::update()
{
  using namespace COVERAGE;

  const bool isReference(isAvailable(_referenceCache->coverageOf(_visibleInterval)));
  const bool isAlignment(isAvailable(_alignmentCache->coverageOf(_visibleInterval)));
  const TRACK_STATE::index_t state(TRACK_STATE::getState(isReference, isAlignment));
  if (state == TRACK_STATE::WAITING_BOTH) return;

  RenderSet renderSet;
  if (isReference) addReferenceRecords(renderSet);
  if (isAlignment) addPileupRecords(isReference, renderSet);

  if ((_emissionCount > 0) && (state == _state) && (renderSet == _renderSet)) return;

  _state = state;
  _renderSet.swap(renderSet);
  _emissionCount++;
  if (_renderer) _renderer(_renderSet);
}

void PileupTrack::addReferenceRecords(RenderSet& renderSet) const
{
  for (const ReferenceBases& segment : _referenceCache->dataFor(_visibleInterval)) {
    const unsigned segmentSize(segment.bases.size());
    for (unsigned offset(0); offset < segmentSize; ++offset) {
      renderSet.push_back(RenderRecord::makeReference(segment.beginPos + offset, segment.bases[offset]));
    }
  }
}

void PileupTrack::addPileupRecords(const bool isReference, RenderSet& renderSet)
{
  const std::vector<const PileupAlignment*> alignments(
      _alignmentCache->dataFor(_visibleInterval, _isContainedOnly));

  std::vector<LayoutItem> batch;
  for (const PileupAlignment* alignment : alignments) {
    batch.emplace_back(alignment->id, alignment->refSpan());
  }
  _layout.addItems(batch);

  extendReferenceWindow(alignments);
  if (isReference) updateMismatches(alignments);

  static const std::vector<Mismatch> noMismatches;
  for (const PileupAlignment* alignment : alignments) {
    const auto                   mismatchIter(_mismatches.find(alignment->id));
    const std::vector<Mismatch>& mismatches(
        (mismatchIter == _mismatches.end()) ? noMismatches : mismatchIter->second.mismatches);
    renderSet.push_back(
        RenderRecord::makePileup(alignment->id, *_layout.getRow(alignment->id), alignment->refSpan(), mismatches));
  }
}

void PileupTrack::extendReferenceWindow(const std::vector<const PileupAlignment*>& alignments)
{
  known_pos_range2 hull(_referenceWindow.range());
  for (const PileupAlignment* alignment : alignments) {
    if (alignment->contig != _referenceWindow.contig()) continue;
    hull.merge_range(alignment->refSpan());
  }
  if (hull == _referenceWindow.range()) return;

  const known_pos_range2 oldRange(_referenceWindow.range());
  const known_pos_range2 newRange(getBlockRange(hull, referenceBlockSize));
  _referenceWindow = GenomeInterval(_referenceWindow.contig(), newRange);

  // the window only grows, so request just the new flanks
  if (newRange.begin_pos() < oldRange.begin_pos()) {
    _referenceCache->request(GenomeInterval(_referenceWindow.contig(), newRange.begin_pos(), oldRange.begin_pos()));
  }
  if (newRange.end_pos() > oldRange.end_pos()) {
    _referenceCache->request(GenomeInterval(_referenceWindow.contig(), oldRange.end_pos(), newRange.end_pos()));
  }
}

bool PileupTrack::isDetectionNeeded(const PileupAlignment& alignment) const
{
  const auto mismatchIter(_mismatches.find(alignment.id));
  if (mismatchIter == _mismatches.end()) return true;

  for (const known_pos_range2& pendingRange : mismatchIter->second.pendingRanges) {
    if (COVERAGE::isAvailable(_referenceCache->coverageOf(GenomeInterval(alignment.contig, pendingRange)))) {
      return true;
    }
  }
  return false;
}

void PileupTrack::updateMismatches(const std::vector<const PileupAlignment*>& alignments)
{
  for (const PileupAlignment* alignment : alignments) {
    if (!isDetectionNeeded(*alignment)) continue;

    const std::vector<ReferenceBases> referenceSegments(_referenceCache->dataFor(alignment->refInterval()));
    const MismatchDetector            detector(referenceSegments);
    _mismatches[alignment->id] = detector.detect(*alignment);
    _detectionCount++;
  }
}
