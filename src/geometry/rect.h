// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_GEOMETRY_RECT_H_
#define MARKPLACE_GEOMETRY_RECT_H_

#include "markplace/markplace.h"

namespace markplace {
namespace internal {

struct PointF {
  double x = 0.0;
  double y = 0.0;
};

struct Size {
  double width = 0.0;
  double height = 0.0;
};

/// Axis-aligned rectangle in target pixels.
struct Rect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  double right() const { return x + width; }
  double bottom() const { return y + height; }
  bool Contains(const PointF& p) const {
    return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
  }
};

/// Anchors in tie-break order.
constexpr MarkPlaceAnchor kAnchorOrder[4] = {
    kMarkPlaceAnchorTopLeft, kMarkPlaceAnchorTopRight,
    kMarkPlaceAnchorBottomLeft, kMarkPlaceAnchorBottomRight};

/// Clamp `value` into [lo, hi]; NaN yields `lo`.  Requires lo <= hi.
double ClampPixel(double value, double lo, double hi);

/// Area of the intersection of two rectangles (0 when disjoint).
double OverlapArea(const Rect& a, const Rect& b);

/// Corner radius actually drawn: capped at half the short side.
double EffectiveCornerRadius(const Rect& rect, double radius);

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_GEOMETRY_RECT_H_
