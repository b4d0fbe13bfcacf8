// Copyright 2026 The markplace Authors

#include "geometry/rect.h"

#include <algorithm>
#include <cmath>

namespace markplace {
namespace internal {

double ClampPixel(double value, double lo, double hi) {
  if (!std::isfinite(value)) return lo;
  return (std::min)((std::max)(value, lo), hi);
}

double OverlapArea(const Rect& a, const Rect& b) {
  double w = (std::min)(a.right(), b.right()) - (std::max)(a.x, b.x);
  double h = (std::min)(a.bottom(), b.bottom()) - (std::max)(a.y, b.y);
  if (!(w > 0.0) || !(h > 0.0)) return 0.0;
  return w * h;
}

double EffectiveCornerRadius(const Rect& rect, double radius) {
  if (!(radius > 0.0)) return 0.0;
  double cap = (std::min)(rect.width, rect.height) / 2.0;
  return (std::max)(0.0, (std::min)(radius, cap));
}

}  // namespace internal
}  // namespace markplace
