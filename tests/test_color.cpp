// Copyright 2026 The markplace Authors
// Tests for: markplace_color_from_hex, markplace_color_apply_opacity

#include <cstdint>

#include "gtest/gtest.h"
#include "markplace/markplace.h"

// ---------------------------------------------------------------------------
// Hex parsing
// ---------------------------------------------------------------------------

TEST(ColorTest, FromHex_RRGGBB) {
  uint32_t argb = 0;
  EXPECT_EQ(markplace_color_from_hex("#FF8000", &argb), kMarkPlaceOk);
  EXPECT_EQ(argb, 0xFFFF8000u);
}

TEST(ColorTest, FromHex_NoHash) {
  uint32_t argb = 0;
  EXPECT_EQ(markplace_color_from_hex("00ff00", &argb), kMarkPlaceOk);
  EXPECT_EQ(argb, 0xFF00FF00u);
}

TEST(ColorTest, FromHex_RGB) {
  uint32_t argb = 0;
  EXPECT_EQ(markplace_color_from_hex("#F00", &argb), kMarkPlaceOk);
  EXPECT_EQ(argb, 0xFFFF0000u);
}

TEST(ColorTest, FromHex_RRGGBBAA) {
  uint32_t argb = 0;
  EXPECT_EQ(markplace_color_from_hex("#00000066", &argb), kMarkPlaceOk);
  EXPECT_EQ(argb, 0x66000000u);
}

TEST(ColorTest, FromHex_Invalid) {
  uint32_t argb = 0x12345678;
  EXPECT_EQ(markplace_color_from_hex("#GGHHII", &argb),
            kMarkPlaceErrorInvalidParam);
  EXPECT_EQ(markplace_color_from_hex("#1234", &argb),
            kMarkPlaceErrorInvalidParam);
  EXPECT_EQ(markplace_color_from_hex("", &argb), kMarkPlaceErrorInvalidParam);
  EXPECT_EQ(argb, 0x12345678u);
}

TEST(ColorTest, FromHex_NullParams) {
  uint32_t argb = 0;
  EXPECT_EQ(markplace_color_from_hex(nullptr, &argb),
            kMarkPlaceErrorInvalidParam);
  EXPECT_EQ(markplace_color_from_hex("#FFF", nullptr),
            kMarkPlaceErrorInvalidParam);
}

// ---------------------------------------------------------------------------
// Opacity
// ---------------------------------------------------------------------------

TEST(ColorTest, ApplyOpacity_ScalesAlphaOnly) {
  EXPECT_EQ(markplace_color_apply_opacity(0xFFFFFFFF, 0.6), 0x99FFFFFFu);
  EXPECT_EQ(markplace_color_apply_opacity(0x80123456, 0.5), 0x40123456u);
}

TEST(ColorTest, ApplyOpacity_Bounds) {
  EXPECT_EQ(markplace_color_apply_opacity(0xFF102030, 1.0), 0xFF102030u);
  EXPECT_EQ(markplace_color_apply_opacity(0xFF102030, 0.0), 0x00102030u);
  EXPECT_EQ(markplace_color_apply_opacity(0xFF102030, 2.0), 0xFF102030u);
  EXPECT_EQ(markplace_color_apply_opacity(0xFF102030, -1.0), 0x00102030u);
}
