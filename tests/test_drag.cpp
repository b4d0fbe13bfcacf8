// Copyright 2026 The markplace Authors
// Tests for: drag state machine, markplace_session_pointer_event,
//            markplace_session_set_patch_callback

#include <vector>

#include "gtest/gtest.h"
#include "markplace/markplace.h"

#include "drag/drag_controller.h"

using markplace::internal::DragController;
using markplace::internal::DragOutcome;
using markplace::internal::DragState;
using markplace::internal::DragSurface;
using markplace::internal::PointerEvent;
using markplace::internal::PointF;
using markplace::internal::PositionPatch;

namespace {

DragSurface Surface400() {
  DragSurface surface;
  surface.canvas = {400, 400};
  surface.overlay = {166, 341, 210, 35};
  surface.visible = true;
  surface.anchor = kMarkPlaceAnchorBottomRight;
  surface.mode = kMarkPlacePositionPixel;
  return surface;
}

PointerEvent Event(MarkPlacePointerEventType type, int id, double x,
                   double y) {
  PointerEvent e;
  e.type = type;
  e.pointer_id = id;
  e.position = PointF{x, y};
  return e;
}

class DragControllerTest : public ::testing::Test {
 protected:
  DragControllerTest()
      : drag_([this](const PositionPatch& p) { patches_.push_back(p); }) {}

  std::vector<PositionPatch> patches_;
  DragController drag_;
};

}  // namespace

// ---------------------------------------------------------------------------
// State machine
// ---------------------------------------------------------------------------

TEST_F(DragControllerTest, MoveIntoTopLeftEmitsTopLeftPatch) {
  DragSurface surface = Surface400();
  EXPECT_EQ(drag_.HandlePointerEvent(Event(kMarkPlacePointerDown, 1, 170, 345),
                                     surface),
            DragOutcome::kStarted);
  EXPECT_EQ(drag_.state(), DragState::kDragging);

  EXPECT_EQ(drag_.HandlePointerEvent(Event(kMarkPlacePointerMove, 1, 14, 14),
                                     surface),
            DragOutcome::kMoved);
  ASSERT_EQ(patches_.size(), 1u);
  EXPECT_EQ(patches_[0].anchor, kMarkPlaceAnchorTopLeft);
  EXPECT_DOUBLE_EQ(patches_[0].offset_x, 10);
  EXPECT_DOUBLE_EQ(patches_[0].offset_y, 10);

  EXPECT_EQ(
      drag_.HandlePointerEvent(Event(kMarkPlacePointerUp, 1, 14, 14), surface),
      DragOutcome::kEnded);
  EXPECT_EQ(drag_.state(), DragState::kIdle);
}

TEST_F(DragControllerTest, RatioModePatchIsFractionOfCanvas) {
  DragSurface surface = Surface400();
  surface.mode = kMarkPlacePositionRatio;
  drag_.HandlePointerEvent(Event(kMarkPlacePointerDown, 1, 170, 345), surface);
  drag_.HandlePointerEvent(Event(kMarkPlacePointerMove, 1, 14, 14), surface);
  ASSERT_EQ(patches_.size(), 1u);
  EXPECT_DOUBLE_EQ(patches_[0].offset_x, 0.025);
  EXPECT_DOUBLE_EQ(patches_[0].offset_y, 0.025);
}

TEST_F(DragControllerTest, DownOutsideOverlayIsRejected) {
  DragSurface surface = Surface400();
  EXPECT_EQ(drag_.HandlePointerEvent(Event(kMarkPlacePointerDown, 1, 10, 10),
                                     surface),
            DragOutcome::kRejected);
  EXPECT_EQ(drag_.state(), DragState::kIdle);

  surface.visible = false;
  EXPECT_EQ(drag_.HandlePointerEvent(Event(kMarkPlacePointerDown, 1, 170, 345),
                                     surface),
            DragOutcome::kRejected);
}

TEST_F(DragControllerTest, OtherPointersCannotMoveOrRelease) {
  DragSurface surface = Surface400();
  drag_.HandlePointerEvent(Event(kMarkPlacePointerDown, 1, 170, 345), surface);

  EXPECT_EQ(drag_.HandlePointerEvent(Event(kMarkPlacePointerDown, 2, 200, 350),
                                     surface),
            DragOutcome::kRejected);
  EXPECT_EQ(drag_.HandlePointerEvent(Event(kMarkPlacePointerMove, 2, 20, 20),
                                     surface),
            DragOutcome::kIgnored);
  EXPECT_EQ(
      drag_.HandlePointerEvent(Event(kMarkPlacePointerUp, 2, 20, 20), surface),
      DragOutcome::kIgnored);
  EXPECT_TRUE(patches_.empty());
  EXPECT_EQ(drag_.state(), DragState::kDragging);
  EXPECT_EQ(drag_.pointer_id(), 1);
}

TEST_F(DragControllerTest, ReleaseOutsideCanvasEndsDrag) {
  DragSurface surface = Surface400();
  drag_.HandlePointerEvent(Event(kMarkPlacePointerDown, 1, 170, 345), surface);
  EXPECT_EQ(drag_.HandlePointerEvent(Event(kMarkPlacePointerUp, 1, -50, 900),
                                     surface),
            DragOutcome::kEnded);
  EXPECT_EQ(drag_.state(), DragState::kIdle);
}

TEST_F(DragControllerTest, MoveBeyondCanvasClampsToEdge) {
  DragSurface surface = Surface400();
  drag_.HandlePointerEvent(Event(kMarkPlacePointerDown, 1, 170, 345), surface);
  drag_.HandlePointerEvent(Event(kMarkPlacePointerMove, 1, 5000, 5000),
                           surface);
  ASSERT_EQ(patches_.size(), 1u);
  EXPECT_EQ(patches_[0].anchor, kMarkPlaceAnchorBottomRight);
  EXPECT_DOUBLE_EQ(patches_[0].offset_x, 0);
  EXPECT_DOUBLE_EQ(patches_[0].offset_y, 0);
}

TEST_F(DragControllerTest, CancelAndCaptureLossEndDrag) {
  DragSurface surface = Surface400();
  EXPECT_EQ(drag_.HandlePointerEvent(Event(kMarkPlacePointerCancel, 1, 0, 0),
                                     surface),
            DragOutcome::kIgnored);

  drag_.HandlePointerEvent(Event(kMarkPlacePointerDown, 1, 170, 345), surface);
  EXPECT_EQ(drag_.HandlePointerEvent(Event(kMarkPlacePointerCancel, 7, 0, 0),
                                     surface),
            DragOutcome::kEnded);
  EXPECT_EQ(drag_.state(), DragState::kIdle);

  drag_.HandlePointerEvent(Event(kMarkPlacePointerDown, 3, 170, 345), surface);
  EXPECT_EQ(drag_.HandlePointerEvent(
                Event(kMarkPlacePointerCaptureLost, 3, 0, 0), surface),
            DragOutcome::kEnded);
  EXPECT_EQ(drag_.state(), DragState::kIdle);
  EXPECT_TRUE(patches_.empty());
}

TEST_F(DragControllerTest, MoveWithoutDragIsIgnored) {
  EXPECT_EQ(drag_.HandlePointerEvent(Event(kMarkPlacePointerMove, 1, 5, 5),
                                     Surface400()),
            DragOutcome::kIgnored);
  EXPECT_TRUE(patches_.empty());
}

// ---------------------------------------------------------------------------
// Session integration
// ---------------------------------------------------------------------------

namespace {

int HalfEmMeasure(const char* text, const char*, double font_size_px,
                  double* out_width, double* out_height, void*) {
  size_t n = 0;
  for (const char* p = text; *p; ++p) {
    if ((static_cast<unsigned char>(*p) & 0xC0) != 0x80) ++n;
  }
  *out_width = n * font_size_px * 0.5;
  *out_height = font_size_px;
  return 1;
}

void RecordPatch(const MarkPlacePositionPatch* patch, void* userdata) {
  static_cast<std::vector<MarkPlacePositionPatch>*>(userdata)->push_back(
      *patch);
}

class SessionDragTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ctx_ = markplace_context_create();
    ASSERT_NE(ctx_, nullptr);
    markplace_set_text_measure_callback(ctx_, HalfEmMeasure, nullptr);
    markplace_spec_init_default(&spec_, nullptr);
  }

  void TearDown() override {
    markplace_session_destroy(session_);
    markplace_context_destroy(ctx_);
  }

  void Open(std::vector<MarkPlaceTarget> targets, int main_index) {
    session_ = markplace_session_create(ctx_, &spec_, targets.data(),
                                        static_cast<int>(targets.size()),
                                        main_index);
    ASSERT_NE(session_, nullptr);
    markplace_session_set_patch_callback(session_, RecordPatch, &patches_);
  }

  MarkPlaceError Send(MarkPlacePointerEventType type, double x, double y,
                      int id = 1) {
    MarkPlacePointerEvent e = {type, id, x, y};
    return markplace_session_pointer_event(session_, &e);
  }

  MarkPlaceContext* ctx_ = nullptr;
  MarkPlaceSession* session_ = nullptr;
  MarkPlaceSpec spec_;
  std::vector<MarkPlacePositionPatch> patches_;
};

}  // namespace

TEST_F(SessionDragTest, DragToTopLeftQuadrant) {
  Open({{400, 400}}, 0);
  MarkPlacePlacement p = {};
  ASSERT_EQ(markplace_session_get_placement(session_, 0, &p), kMarkPlaceOk);
  EXPECT_DOUBLE_EQ(p.x, 166);
  EXPECT_DOUBLE_EQ(p.y, 341);
  EXPECT_DOUBLE_EQ(p.width, 210);
  EXPECT_DOUBLE_EQ(p.height, 35);

  EXPECT_EQ(Send(kMarkPlacePointerDown, 170, 345), kMarkPlaceOk);
  EXPECT_EQ(markplace_session_is_dragging(session_), 1);
  EXPECT_EQ(Send(kMarkPlacePointerMove, 14, 14), kMarkPlaceOk);
  EXPECT_EQ(Send(kMarkPlacePointerUp, 14, 14), kMarkPlaceOk);
  EXPECT_EQ(markplace_session_is_dragging(session_), 0);

  ASSERT_EQ(patches_.size(), 1u);
  EXPECT_EQ(patches_[0].anchor, kMarkPlaceAnchorTopLeft);
  EXPECT_DOUBLE_EQ(patches_[0].offset_x, 10);
  EXPECT_DOUBLE_EQ(patches_[0].offset_y, 10);

  ASSERT_EQ(markplace_session_get_placement(session_, 0, &p), kMarkPlaceOk);
  EXPECT_DOUBLE_EQ(p.x, 10);
  EXPECT_DOUBLE_EQ(p.y, 10);
  EXPECT_EQ(p.active_anchor, kMarkPlaceAnchorTopLeft);

  MarkPlaceSpec current;
  markplace_session_get_spec(session_, &current);
  EXPECT_EQ(current.anchor, kMarkPlaceAnchorTopLeft);
  EXPECT_DOUBLE_EQ(current.offset_x, 10);
}

TEST_F(SessionDragTest, PatchAppliesToSecondaryTargets) {
  spec_.position_mode = kMarkPlacePositionRatio;
  spec_.offset_x = 0.06;
  spec_.offset_y = 0.06;
  Open({{800, 600}, {400, 400}}, 1);

  EXPECT_EQ(Send(kMarkPlacePointerDown, 170, 345), kMarkPlaceOk);
  EXPECT_EQ(Send(kMarkPlacePointerMove, 14, 14), kMarkPlaceOk);
  ASSERT_EQ(patches_.size(), 1u);
  EXPECT_DOUBLE_EQ(patches_[0].offset_x, 0.025);

  MarkPlacePlacement other = {};
  markplace_session_get_placement(session_, 0, &other);
  EXPECT_DOUBLE_EQ(other.x, 20);
  EXPECT_DOUBLE_EQ(other.y, 15);
}

TEST_F(SessionDragTest, DownOffOverlayReportsRejection) {
  Open({{400, 400}}, 0);
  EXPECT_EQ(Send(kMarkPlacePointerDown, 5, 5), kMarkPlaceErrorDragRejected);
  EXPECT_EQ(markplace_session_is_dragging(session_), 0);
  EXPECT_TRUE(patches_.empty());
}

TEST_F(SessionDragTest, HiddenOverlayCannotBeDragged) {
  markplace_font_register(ctx_, "slow", "Slow Sans", "Slow", 0);
  spec_.font_key = "slow";
  Open({{400, 400}}, 0);
  MarkPlacePlacement p = {};
  markplace_session_get_placement(session_, 0, &p);
  EXPECT_EQ(p.visible, 0);
  EXPECT_EQ(Send(kMarkPlacePointerDown, p.x + 1, p.y + 1),
            kMarkPlaceErrorDragRejected);
}
