// Copyright 2026 The markplace Authors

#include "placement/placement_resolver.h"

#include <algorithm>
#include <cmath>

#include "geometry/anchor_resolver.h"
#include "geometry/coordinate_converter.h"

namespace markplace {
namespace internal {

namespace {

double NonNegativeFinite(double v) {
  return (std::isfinite(v) && v > 0.0) ? v : 0.0;
}

}  // namespace

Placement ResolvePlacement(const WatermarkSpec& spec, const Size& target,
                           const Size& content) {
  Size canvas{NonNegativeFinite(target.width), NonNegativeFinite(target.height)};
  Size box{NonNegativeFinite(content.width), NonNegativeFinite(content.height)};

  Placement out;
  out.scale = ComputePreviewScale(spec, canvas);

  PointF offset = ToPixelOffset(spec, canvas);
  PointF origin = AnchoredTopLeft(spec.anchor, offset, box, canvas);

  out.rect.width = box.width;
  out.rect.height = box.height;
  out.rect.x =
      ClampPixel(origin.x, 0.0, (std::max)(0.0, canvas.width - box.width));
  out.rect.y =
      ClampPixel(origin.y, 0.0, (std::max)(0.0, canvas.height - box.height));
  out.active_anchor =
      InferDominantAnchor(out.rect, canvas.width, canvas.height, spec.anchor);
  out.visible = true;
  out.provisional = false;
  return out;
}

}  // namespace internal
}  // namespace markplace
