// Copyright 2026 The markplace Authors

#include "drag/drag_controller.h"

#include <algorithm>

#include "core/logger.h"
#include "core/watermark_spec.h"
#include "geometry/anchor_resolver.h"
#include "geometry/coordinate_converter.h"

namespace markplace {
namespace internal {

DragController::DragController(PatchSink sink) : sink_(std::move(sink)) {}

bool DragController::Begin(int pointer_id, const PointF& pointer,
                           const DragSurface& surface) {
  if (state_ == DragState::kDragging && pointer_id != pointer_id_)
    return false;
  if (!surface.visible || !surface.overlay.Contains(pointer)) return false;

  state_ = DragState::kDragging;
  pointer_id_ = pointer_id;
  grab_offset_ = {pointer.x - surface.overlay.x, pointer.y - surface.overlay.y};
  last_anchor_ = surface.anchor;
  MARKPLACE_LOG_DEBUG("Drag started (pointer {}) at {},{}", pointer_id,
                      pointer.x, pointer.y);
  return true;
}

bool DragController::Move(int pointer_id, const PointF& pointer,
                          const DragSurface& surface) {
  if (state_ != DragState::kDragging || pointer_id != pointer_id_)
    return false;

  const Size& canvas = surface.canvas;
  Rect box = surface.overlay;
  box.x = ClampPixel(pointer.x - grab_offset_.x, 0.0,
                     (std::max)(0.0, canvas.width - box.width));
  box.y = ClampPixel(pointer.y - grab_offset_.y, 0.0,
                     (std::max)(0.0, canvas.height - box.height));

  MarkPlaceAnchor anchor =
      InferDominantAnchor(box, canvas.width, canvas.height, last_anchor_);
  PointF offsets =
      DeriveOffsetsForAnchor(anchor, box, canvas.width, canvas.height);
  PointF stored = ToStoredOffset(surface.mode, offsets, canvas);
  last_anchor_ = anchor;

  PositionPatch patch;
  patch.anchor = anchor;
  patch.offset_x = stored.x;
  patch.offset_y = stored.y;
  MARKPLACE_LOG_TRACE("Drag patch: {} ({}, {})", AnchorName(anchor),
                      patch.offset_x, patch.offset_y);
  if (sink_) sink_(patch);
  return true;
}

bool DragController::End(int pointer_id) {
  if (state_ != DragState::kDragging || pointer_id != pointer_id_)
    return false;
  state_ = DragState::kIdle;
  pointer_id_ = -1;
  MARKPLACE_LOG_DEBUG("Drag ended (pointer {})", pointer_id);
  return true;
}

void DragController::Cancel() {
  if (state_ == DragState::kDragging)
    MARKPLACE_LOG_DEBUG("Drag cancelled (pointer {})", pointer_id_);
  state_ = DragState::kIdle;
  pointer_id_ = -1;
}

DragOutcome DragController::HandlePointerEvent(const PointerEvent& event,
                                               const DragSurface& surface) {
  switch (event.type) {
    case kMarkPlacePointerDown:
      return Begin(event.pointer_id, event.position, surface)
                 ? DragOutcome::kStarted
                 : DragOutcome::kRejected;
    case kMarkPlacePointerMove:
      return Move(event.pointer_id, event.position, surface)
                 ? DragOutcome::kMoved
                 : DragOutcome::kIgnored;
    case kMarkPlacePointerUp:
      return End(event.pointer_id) ? DragOutcome::kEnded
                                   : DragOutcome::kIgnored;
    case kMarkPlacePointerCancel:
    case kMarkPlacePointerCaptureLost:
      if (state_ == DragState::kIdle) return DragOutcome::kIgnored;
      Cancel();
      return DragOutcome::kEnded;
    default:
      return DragOutcome::kIgnored;
  }
}

}  // namespace internal
}  // namespace markplace
