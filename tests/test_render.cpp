// Copyright 2026 The markplace Authors
// Tests for: markplace_image_*, markplace_render_is_supported,
//            markplace_render_overlay

#include <cmath>
#include <cstdint>

#include "gtest/gtest.h"
#include "markplace/markplace.h"

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

const uint8_t* PixelAt(const MarkPlaceImage* image, int x, int y) {
  return markplace_image_get_data(image) +
         static_cast<size_t>(y) * markplace_image_get_stride(image) + x * 4;
}

class RenderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ctx_ = markplace_context_create();
    ASSERT_NE(ctx_, nullptr);
    markplace_set_text_measure_callback(ctx_, HalfEmMeasure, nullptr);
    markplace_spec_init_default(&spec_, nullptr);
  }

  void TearDown() override { markplace_context_destroy(ctx_); }

  MarkPlaceContext* ctx_ = nullptr;
  MarkPlaceSpec spec_;
};

}  // namespace

// ---------------------------------------------------------------------------
// Images
// ---------------------------------------------------------------------------

TEST(ImageTest, CreateFillsPremultipliedBgra) {
  MarkPlaceImage* image = markplace_image_create(4, 3, 0xFF102030);
  ASSERT_NE(image, nullptr);
  EXPECT_EQ(markplace_image_get_width(image), 4);
  EXPECT_EQ(markplace_image_get_height(image), 3);
  EXPECT_EQ(markplace_image_get_stride(image), 16);
  const uint8_t* px = PixelAt(image, 3, 2);
  EXPECT_EQ(px[0], 0x30);
  EXPECT_EQ(px[1], 0x20);
  EXPECT_EQ(px[2], 0x10);
  EXPECT_EQ(px[3], 0xFF);
  markplace_image_destroy(image);
}

TEST(ImageTest, TranslucentFillIsPremultiplied) {
  MarkPlaceImage* image = markplace_image_create(1, 1, 0x80FF0000);
  ASSERT_NE(image, nullptr);
  const uint8_t* px = PixelAt(image, 0, 0);
  EXPECT_EQ(px[2], 128);
  EXPECT_EQ(px[3], 128);
  markplace_image_destroy(image);
}

TEST(ImageTest, InvalidSizeReturnsNull) {
  EXPECT_EQ(markplace_image_create(0, 10, 0), nullptr);
  EXPECT_EQ(markplace_image_create(10, -1, 0), nullptr);
  EXPECT_EQ(markplace_image_create(100000, 100000, 0), nullptr);
  EXPECT_EQ(markplace_image_get_width(nullptr), 0);
  EXPECT_EQ(markplace_image_get_data(nullptr), nullptr);
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

TEST_F(RenderTest, UnsupportedBuildReportsNotSupported) {
  if (markplace_render_is_supported(ctx_)) {
    GTEST_SKIP() << "Overlay rendering available";
  }
  MarkPlaceImage* image = markplace_image_create(64, 64, 0xFFFFFFFF);
  ASSERT_NE(image, nullptr);
  EXPECT_EQ(markplace_render_overlay(ctx_, image, &spec_, nullptr),
            kMarkPlaceErrorNotSupported);
  EXPECT_EQ(markplace_get_last_error(ctx_), kMarkPlaceErrorNotSupported);
  markplace_image_destroy(image);
}

TEST_F(RenderTest, BackgroundIsDrawnInsidePlacement) {
  if (!markplace_render_is_supported(ctx_)) {
    GTEST_SKIP() << "Overlay rendering unavailable";
  }
  spec_.background_enabled = 1;
  spec_.background_color = 0xFF000000;
  spec_.opacity = 1.0;
  MarkPlaceImage* image = markplace_image_create(320, 320, 0xFFFFFFFF);
  ASSERT_NE(image, nullptr);

  MarkPlacePlacement p = {};
  ASSERT_EQ(markplace_render_overlay(ctx_, image, &spec_, &p), kMarkPlaceOk);
  EXPECT_DOUBLE_EQ(p.width, 184.8);
  EXPECT_DOUBLE_EQ(p.height, 44.8);
  EXPECT_EQ(p.visible, 1);

  int x = static_cast<int>(std::floor(p.x)) + 2;
  int y = static_cast<int>(std::floor(p.y)) + 2;
  const uint8_t* inside = PixelAt(image, x, y);
  EXPECT_EQ(inside[0], 0);
  EXPECT_EQ(inside[1], 0);
  EXPECT_EQ(inside[2], 0);
  EXPECT_EQ(inside[3], 255);

  const uint8_t* outside = PixelAt(image, 0, 0);
  EXPECT_EQ(outside[0], 255);
  EXPECT_EQ(outside[3], 255);
  markplace_image_destroy(image);
}

TEST_F(RenderTest, TextOnlyLeavesCornersUntouched) {
  if (!markplace_render_is_supported(ctx_)) {
    GTEST_SKIP() << "Overlay rendering unavailable";
  }
  MarkPlaceImage* image = markplace_image_create(320, 320, 0xFF0000FF);
  ASSERT_NE(image, nullptr);
  ASSERT_EQ(markplace_render_overlay(ctx_, image, &spec_, nullptr),
            kMarkPlaceOk);
  const uint8_t* corner = PixelAt(image, 2, 2);
  EXPECT_EQ(corner[0], 255);
  EXPECT_EQ(corner[2], 0);
  markplace_image_destroy(image);
}

TEST_F(RenderTest, PendingFontIsNotReady) {
  if (!markplace_render_is_supported(ctx_)) {
    GTEST_SKIP() << "Overlay rendering unavailable";
  }
  markplace_font_register(ctx_, "pending", "Pending Sans", "Pending", 0);
  spec_.font_key = "pending";
  MarkPlaceImage* image = markplace_image_create(64, 64, 0xFFFFFFFF);
  ASSERT_NE(image, nullptr);
  EXPECT_EQ(markplace_render_overlay(ctx_, image, &spec_, nullptr),
            kMarkPlaceErrorNotReady);
  markplace_image_destroy(image);
}

TEST_F(RenderTest, PendingIconIsNotReady) {
  if (!markplace_render_is_supported(ctx_)) {
    GTEST_SKIP() << "Overlay rendering unavailable";
  }
  spec_.icon_enabled = 1;
  spec_.icon_image_ref = "logo";
  MarkPlaceImage* image = markplace_image_create(64, 64, 0xFFFFFFFF);
  ASSERT_NE(image, nullptr);
  EXPECT_EQ(markplace_render_overlay(ctx_, image, &spec_, nullptr),
            kMarkPlaceErrorNotReady);

  const uint8_t pixels[4 * 4 * 4] = {};
  ASSERT_EQ(markplace_icon_notify_decoded(ctx_, "logo", 4, 4, pixels, 16),
            kMarkPlaceOk);
  MarkPlacePlacement p = {};
  EXPECT_EQ(markplace_render_overlay(ctx_, image, &spec_, &p), kMarkPlaceOk);
  markplace_image_destroy(image);
}

TEST_F(RenderTest, RoundedBackgroundRenders) {
  if (!markplace_render_is_supported(ctx_)) {
    GTEST_SKIP() << "Overlay rendering unavailable";
  }
  spec_.rounded_background_enabled = 1;
  spec_.border_enabled = 1;
  spec_.border_width_px = 2;
  MarkPlaceImage* image = markplace_image_create(640, 360, 0xFFFFFFFF);
  ASSERT_NE(image, nullptr);
  MarkPlacePlacement p = {};
  ASSERT_EQ(markplace_render_overlay(ctx_, image, &spec_, &p), kMarkPlaceOk);
  EXPECT_LE(p.x + p.width, 640.0);
  EXPECT_LE(p.y + p.height, 360.0);
  markplace_image_destroy(image);
}

TEST_F(RenderTest, RoundedBackgroundClipsBoxCorners) {
  if (!markplace_render_is_supported(ctx_)) {
    GTEST_SKIP() << "Overlay rendering unavailable";
  }
  spec_.rounded_background_enabled = 1;
  spec_.background_color = 0xFF000000;
  spec_.opacity = 1.0;
  MarkPlaceImage* image = markplace_image_create(320, 320, 0xFFFFFFFF);
  ASSERT_NE(image, nullptr);
  MarkPlacePlacement p = {};
  ASSERT_EQ(markplace_render_overlay(ctx_, image, &spec_, &p), kMarkPlaceOk);

  // Pill shape: radius is half the 44.8px height.
  int left = static_cast<int>(std::floor(p.x));
  int top = static_cast<int>(std::floor(p.y));
  const uint8_t* corner = PixelAt(image, left + 1, top + 1);
  EXPECT_EQ(corner[0], 255);
  EXPECT_EQ(corner[1], 255);

  // Left cap, inside the padding and clear of the text.
  const uint8_t* cap =
      PixelAt(image, left + 3, static_cast<int>(p.y + p.height / 2.0));
  EXPECT_EQ(cap[0], 0);
  EXPECT_EQ(cap[3], 255);
  markplace_image_destroy(image);
}
