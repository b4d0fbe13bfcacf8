// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_DRAG_DRAG_CONTROLLER_H_
#define MARKPLACE_DRAG_DRAG_CONTROLLER_H_

#include <functional>

#include "geometry/rect.h"
#include "markplace/markplace.h"

namespace markplace {
namespace internal {

enum class DragState { kIdle, kDragging };

/// Position update in the spec's position mode.
struct PositionPatch {
  MarkPlaceAnchor anchor = kMarkPlaceAnchorBottomRight;
  double offset_x = 0.0;
  double offset_y = 0.0;
};

struct PointerEvent {
  MarkPlacePointerEventType type = kMarkPlacePointerMove;
  int pointer_id = 0;
  PointF position;
};

/// The draggable overlay on the main target at the time of an event.
struct DragSurface {
  Size canvas;
  Rect overlay;
  bool visible = false;
  MarkPlaceAnchor anchor = kMarkPlaceAnchorBottomRight;
  MarkPlacePositionMode mode = kMarkPlacePositionPixel;
};

enum class DragOutcome {
  kIgnored,   // Event did not concern the controller.
  kRejected,  // Down outside a visible overlay.
  kStarted,
  kMoved,
  kEnded,
};

/// Idle / Dragging state machine turning pointer input into position patches.
/// Only the pointer that started a drag can move or release it; cancel and
/// capture loss end the drag whatever the pointer.
class DragController {
 public:
  using PatchSink = std::function<void(const PositionPatch&)>;

  explicit DragController(PatchSink sink);

  DragController(const DragController&) = delete;
  DragController& operator=(const DragController&) = delete;

  /// Start dragging if `pointer` is inside a visible overlay.
  bool Begin(int pointer_id, const PointF& pointer, const DragSurface& surface);

  /// Move the grabbed overlay and emit one patch.
  bool Move(int pointer_id, const PointF& pointer, const DragSurface& surface);

  /// Release by the capturing pointer, wherever it is.
  bool End(int pointer_id);

  void Cancel();

  DragOutcome HandlePointerEvent(const PointerEvent& event,
                                 const DragSurface& surface);

  DragState state() const { return state_; }
  int pointer_id() const { return pointer_id_; }

 private:
  PatchSink sink_;
  DragState state_ = DragState::kIdle;
  int pointer_id_ = -1;
  PointF grab_offset_;
  MarkPlaceAnchor last_anchor_ = kMarkPlaceAnchorBottomRight;
};

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_DRAG_DRAG_CONTROLLER_H_
