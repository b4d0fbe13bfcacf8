// Copyright 2026 The markplace Authors
// Tests for: markplace_rect_overlap_area, markplace_infer_dominant_anchor,
//            markplace_derive_offsets, markplace_compute_edge_distances,
//            rounded outline and clamping helpers

#include <cmath>
#include <limits>

#include "gtest/gtest.h"
#include "markplace/markplace.h"

#include "geometry/anchor_resolver.h"
#include "geometry/rect.h"

using markplace::internal::Rect;

// ---------------------------------------------------------------------------
// Overlap
// ---------------------------------------------------------------------------

TEST(GeometryTest, OverlapAreaPartial) {
  MarkPlaceRect a = {0, 0, 10, 10};
  MarkPlaceRect b = {5, 5, 10, 10};
  EXPECT_DOUBLE_EQ(markplace_rect_overlap_area(&a, &b), 25.0);
}

TEST(GeometryTest, OverlapAreaDisjointAndTouching) {
  MarkPlaceRect a = {0, 0, 10, 10};
  MarkPlaceRect b = {20, 20, 5, 5};
  MarkPlaceRect c = {10, 0, 5, 5};
  EXPECT_DOUBLE_EQ(markplace_rect_overlap_area(&a, &b), 0.0);
  EXPECT_DOUBLE_EQ(markplace_rect_overlap_area(&a, &c), 0.0);
  EXPECT_DOUBLE_EQ(markplace_rect_overlap_area(&a, nullptr), 0.0);
}

// ---------------------------------------------------------------------------
// Dominant anchor
// ---------------------------------------------------------------------------

TEST(GeometryTest, DominantAnchorPerQuadrant) {
  MarkPlaceRect tl = {10, 10, 50, 20};
  MarkPlaceRect tr = {300, 10, 50, 20};
  MarkPlaceRect bl = {10, 300, 50, 20};
  MarkPlaceRect br = {300, 300, 50, 20};
  auto fb = kMarkPlaceAnchorTopLeft;
  EXPECT_EQ(markplace_infer_dominant_anchor(&tl, 400, 400, fb),
            kMarkPlaceAnchorTopLeft);
  EXPECT_EQ(markplace_infer_dominant_anchor(&tr, 400, 400, fb),
            kMarkPlaceAnchorTopRight);
  EXPECT_EQ(markplace_infer_dominant_anchor(&bl, 400, 400, fb),
            kMarkPlaceAnchorBottomLeft);
  EXPECT_EQ(markplace_infer_dominant_anchor(&br, 400, 400, fb),
            kMarkPlaceAnchorBottomRight);
}

TEST(GeometryTest, DominantAnchorLargestOverlapWins) {
  // Mostly right of center, straddling the horizontal midline slightly low.
  MarkPlaceRect box = {180, 190, 100, 40};
  EXPECT_EQ(markplace_infer_dominant_anchor(&box, 400, 400,
                                            kMarkPlaceAnchorTopLeft),
            kMarkPlaceAnchorBottomRight);
}

TEST(GeometryTest, DominantAnchorTieGoesToEarlierAnchor) {
  // Centered box overlaps all four quadrants equally.
  MarkPlaceRect box = {150, 150, 100, 100};
  EXPECT_EQ(markplace_infer_dominant_anchor(&box, 400, 400,
                                            kMarkPlaceAnchorBottomRight),
            kMarkPlaceAnchorTopLeft);
  // Horizontal tie between the bottom quadrants.
  MarkPlaceRect bottom = {150, 300, 100, 50};
  EXPECT_EQ(markplace_infer_dominant_anchor(&bottom, 400, 400,
                                            kMarkPlaceAnchorTopRight),
            kMarkPlaceAnchorBottomLeft);
}

TEST(GeometryTest, DominantAnchorFallbackWithoutOverlap) {
  MarkPlaceRect empty = {10, 10, 0, 0};
  EXPECT_EQ(markplace_infer_dominant_anchor(&empty, 400, 400,
                                            kMarkPlaceAnchorBottomLeft),
            kMarkPlaceAnchorBottomLeft);
  MarkPlaceRect box = {10, 10, 50, 50};
  EXPECT_EQ(markplace_infer_dominant_anchor(&box, 0, 0,
                                            kMarkPlaceAnchorTopRight),
            kMarkPlaceAnchorTopRight);
  EXPECT_EQ(markplace_infer_dominant_anchor(nullptr, 400, 400,
                                            kMarkPlaceAnchorTopRight),
            kMarkPlaceAnchorTopRight);
}

// ---------------------------------------------------------------------------
// Offsets and edge distances
// ---------------------------------------------------------------------------

TEST(GeometryTest, DeriveOffsetsForEveryAnchor) {
  MarkPlaceRect box = {30, 40, 100, 20};
  double ox = 0, oy = 0;
  ASSERT_EQ(markplace_derive_offsets(kMarkPlaceAnchorTopLeft, &box, 400, 300,
                                     &ox, &oy),
            kMarkPlaceOk);
  EXPECT_DOUBLE_EQ(ox, 30);
  EXPECT_DOUBLE_EQ(oy, 40);
  markplace_derive_offsets(kMarkPlaceAnchorTopRight, &box, 400, 300, &ox, &oy);
  EXPECT_DOUBLE_EQ(ox, 270);
  EXPECT_DOUBLE_EQ(oy, 40);
  markplace_derive_offsets(kMarkPlaceAnchorBottomLeft, &box, 400, 300, &ox,
                           &oy);
  EXPECT_DOUBLE_EQ(ox, 30);
  EXPECT_DOUBLE_EQ(oy, 240);
  markplace_derive_offsets(kMarkPlaceAnchorBottomRight, &box, 400, 300, &ox,
                           &oy);
  EXPECT_DOUBLE_EQ(ox, 270);
  EXPECT_DOUBLE_EQ(oy, 240);
}

TEST(GeometryTest, DeriveOffsetsRejectsBadInput) {
  MarkPlaceRect box = {0, 0, 1, 1};
  double ox = 0, oy = 0;
  EXPECT_EQ(markplace_derive_offsets(static_cast<MarkPlaceAnchor>(7), &box,
                                     10, 10, &ox, &oy),
            kMarkPlaceErrorInvalidParam);
  EXPECT_EQ(markplace_derive_offsets(kMarkPlaceAnchorTopLeft, nullptr, 10, 10,
                                     &ox, &oy),
            kMarkPlaceErrorInvalidParam);
}

TEST(GeometryTest, EdgeDistancesFloorRightAndBottom) {
  MarkPlaceRect box = {350, 20, 100, 30};
  MarkPlaceEdgeDistances d = {};
  ASSERT_EQ(markplace_compute_edge_distances(&box, 400, 400, &d),
            kMarkPlaceOk);
  EXPECT_DOUBLE_EQ(d.top, 20);
  EXPECT_DOUBLE_EQ(d.left, 350);
  EXPECT_DOUBLE_EQ(d.right, 0);
  EXPECT_DOUBLE_EQ(d.bottom, 350);
}

TEST(GeometryTest, ActiveEdgesFollowAnchor) {
  MarkPlaceActiveEdges edges = {};
  ASSERT_EQ(markplace_anchor_active_edges(kMarkPlaceAnchorTopRight, &edges),
            kMarkPlaceOk);
  EXPECT_TRUE(edges.top);
  EXPECT_TRUE(edges.right);
  EXPECT_FALSE(edges.bottom);
  EXPECT_FALSE(edges.left);
  ASSERT_EQ(markplace_anchor_active_edges(kMarkPlaceAnchorBottomLeft, &edges),
            kMarkPlaceOk);
  EXPECT_FALSE(edges.top);
  EXPECT_FALSE(edges.right);
  EXPECT_TRUE(edges.bottom);
  EXPECT_TRUE(edges.left);
}

TEST(GeometryTest, ActiveEdgesRejectBadArguments) {
  MarkPlaceActiveEdges edges = {};
  EXPECT_EQ(markplace_anchor_active_edges(kMarkPlaceAnchorTopLeft, nullptr),
            kMarkPlaceErrorInvalidParam);
  EXPECT_EQ(markplace_anchor_active_edges(static_cast<MarkPlaceAnchor>(9),
                                          &edges),
            kMarkPlaceErrorInvalidParam);
}

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

TEST(GeometryTest, ClampPixelHandlesNaN) {
  using markplace::internal::ClampPixel;
  EXPECT_DOUBLE_EQ(ClampPixel(-5, 0, 10), 0);
  EXPECT_DOUBLE_EQ(ClampPixel(15, 0, 10), 10);
  EXPECT_DOUBLE_EQ(ClampPixel(std::numeric_limits<double>::quiet_NaN(), 0, 10),
                   0);
  EXPECT_DOUBLE_EQ(ClampPixel(std::numeric_limits<double>::infinity(), 0, 10),
                   0);
}

TEST(GeometryTest, CornerRadiusCappedAtHalfShortSide) {
  Rect box{0, 0, 100, 40};
  EXPECT_DOUBLE_EQ(markplace::internal::EffectiveCornerRadius(box, 50), 20);
  EXPECT_DOUBLE_EQ(markplace::internal::EffectiveCornerRadius(box, 8), 8);
  EXPECT_DOUBLE_EQ(markplace::internal::EffectiveCornerRadius(box, -3), 0);
}
