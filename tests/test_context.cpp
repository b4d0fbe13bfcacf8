// Copyright 2026 The markplace Authors
// Tests for: markplace_context_create, markplace_context_destroy,
//            markplace_get_last_error, markplace_get_last_error_message,
//            the markplace.hpp wrapper

#include <vector>

#include "gtest/gtest.h"
#include "markplace/markplace.h"
#include "markplace/markplace.hpp"

namespace {

int FixedMeasure(const char*, const char*, double font_size_px,
                 double* out_width, double* out_height, void*) {
  *out_width = font_size_px * 4;
  *out_height = font_size_px;
  return 1;
}

int FailingMeasure(const char*, const char*, double, double*, double*, void*) {
  return 0;
}

}  // namespace

// ---------------------------------------------------------------------------
// Context lifecycle
// ---------------------------------------------------------------------------

TEST(ContextTest, CreateReturnsNonNull) {
  MarkPlaceContext* ctx = markplace_context_create();
  ASSERT_NE(ctx, nullptr);
  markplace_context_destroy(ctx);
}

TEST(ContextTest, CreateMultipleContexts) {
  MarkPlaceContext* a = markplace_context_create();
  MarkPlaceContext* b = markplace_context_create();
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_NE(a, b);
  markplace_context_destroy(b);
  markplace_context_destroy(a);
}

TEST(ContextTest, InitialErrorIsOk) {
  MarkPlaceContext* ctx = markplace_context_create();
  ASSERT_NE(ctx, nullptr);
  EXPECT_EQ(markplace_get_last_error(ctx), kMarkPlaceOk);
  EXPECT_NE(markplace_get_last_error_message(ctx), nullptr);
  markplace_context_destroy(ctx);
}

TEST(ContextTest, ContextsDoNotShareFontsOrCache) {
  MarkPlaceContext* a = markplace_context_create();
  MarkPlaceContext* b = markplace_context_create();
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  markplace_set_text_measure_callback(a, FixedMeasure, nullptr);

  markplace_font_register(a, "brand", "Brand Sans", "Brand", 0);
  EXPECT_EQ(markplace_font_notify_ready(b, "brand"),
            kMarkPlaceErrorInvalidParam);

  MarkPlaceSpec spec;
  markplace_spec_init_default(&spec, nullptr);
  MarkPlaceTarget target = {320, 320};
  MarkPlaceSession* s = markplace_session_create(a, &spec, &target, 1, 0);
  ASSERT_NE(s, nullptr);
  markplace_session_tick(s);
  EXPECT_EQ(markplace_cache_size(a), 1);
  EXPECT_EQ(markplace_cache_size(b), 0);

  markplace_session_destroy(s);
  markplace_context_destroy(b);
  markplace_context_destroy(a);
}

TEST(ContextTest, FailingMeasureCallbackKeepsContentHidden) {
  MarkPlaceContext* ctx = markplace_context_create();
  ASSERT_NE(ctx, nullptr);
  markplace_set_text_measure_callback(ctx, FailingMeasure, nullptr);
  EXPECT_EQ(markplace_text_measure_is_supported(ctx), 1);

  MarkPlaceSpec spec;
  markplace_spec_init_default(&spec, nullptr);
  MarkPlaceTarget target = {320, 320};
  MarkPlaceSession* s = markplace_session_create(ctx, &spec, &target, 1, 0);
  ASSERT_NE(s, nullptr);
  MarkPlacePlacement p = {};
  markplace_session_get_placement(s, 0, &p);
  EXPECT_EQ(p.visible, 0);
  EXPECT_EQ(markplace_cache_size(ctx), 0);
  markplace_session_destroy(s);
  markplace_context_destroy(ctx);
}

// ---------------------------------------------------------------------------
// C++ wrapper
// ---------------------------------------------------------------------------

TEST(CppWrapperTest, SessionAndPatchHandler) {
  markplace::Context ctx;
  ctx.SetTextMeasureCallback(FixedMeasure, nullptr);

  MarkPlaceSpec spec = markplace::default_spec();
  markplace::Session session(ctx, spec, {{400, 400}}, 0);
  EXPECT_EQ(session.target_count(), 1);

  // 28 * 1.25 = 35 high, 140 wide at (236, 341).
  MarkPlacePlacement p = session.placement(0);
  EXPECT_DOUBLE_EQ(p.width, 140);
  EXPECT_DOUBLE_EQ(p.height, 35);

  std::vector<MarkPlacePositionPatch> patches;
  session.OnPatch([&patches](const MarkPlacePositionPatch& patch) {
    patches.push_back(patch);
  });
  EXPECT_FALSE(session.PointerDown(1, 5, 5));
  ASSERT_TRUE(session.PointerDown(1, p.x + 1, p.y + 1));
  EXPECT_TRUE(session.dragging());
  session.PointerMove(1, 11, 11);
  session.PointerUp(1, 11, 11);
  ASSERT_EQ(patches.size(), 1u);
  EXPECT_EQ(patches[0].anchor, kMarkPlaceAnchorTopLeft);
  EXPECT_DOUBLE_EQ(patches[0].offset_x, 10);
  EXPECT_EQ(session.spec().anchor, kMarkPlaceAnchorTopLeft);
}

TEST(CppWrapperTest, ErrorsBecomeExceptions) {
  markplace::Context ctx;
  EXPECT_THROW(ctx.NotifyFontReady("missing"), markplace::Error);
  try {
    ctx.NotifyIconFailed("");
    FAIL() << "Expected markplace::Error";
  } catch (const markplace::Error& e) {
    EXPECT_EQ(e.code(), kMarkPlaceErrorInvalidParam);
  }
  MarkPlaceSpec spec = markplace::default_spec();
  EXPECT_THROW(markplace::Session(ctx, spec, {}, 0), markplace::Error);
  EXPECT_THROW(markplace::from_hex("#12"), markplace::Error);
  EXPECT_EQ(markplace::from_hex("#abc"), 0xFFAABBCCu);
}
