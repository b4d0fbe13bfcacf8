// Copyright 2026 The markplace Authors

#include "geometry/coordinate_converter.h"

#include <algorithm>
#include <cmath>

namespace markplace {
namespace internal {

namespace {

double BaseWidth(const WatermarkSpec& spec) {
  return (std::isfinite(spec.base_canvas_width) && spec.base_canvas_width > 0.0)
             ? spec.base_canvas_width
             : kDefaultBaseCanvasWidth;
}

}  // namespace

double ComputePreviewScale(const WatermarkSpec& spec, const Size& target) {
  double basis = 0.0;
  switch (spec.adaptive_scale_mode) {
    case kMarkPlaceScaleNone:
      return 1.0;
    case kMarkPlaceScaleLongEdge:
      basis = (std::max)(target.width, target.height);
      break;
    case kMarkPlaceScaleWidth:
      basis = target.width;
      break;
    case kMarkPlaceScaleHeight:
      basis = target.height;
      break;
    case kMarkPlaceScaleShortEdge:
    default:
      basis = (std::min)(target.width, target.height);
      break;
  }
  if (!std::isfinite(basis) || basis < 0.0) basis = 0.0;
  return basis / BaseWidth(spec);
}

PointF ToPixelOffset(const WatermarkSpec& spec, const Size& target) {
  if (spec.position_mode == kMarkPlacePositionRatio)
    return {spec.offset_x * target.width, spec.offset_y * target.height};
  return {spec.offset_x, spec.offset_y};
}

PointF ToStoredOffset(MarkPlacePositionMode mode, const PointF& pixel_offset,
                      const Size& target) {
  if (mode != kMarkPlacePositionRatio) return pixel_offset;
  PointF out;
  out.x = target.width > 0.0 ? pixel_offset.x / target.width : 0.0;
  out.y = target.height > 0.0 ? pixel_offset.y / target.height : 0.0;
  return out;
}

WatermarkSpec ConvertPositionMode(const WatermarkSpec& spec,
                                  MarkPlacePositionMode mode) {
  if (spec.position_mode == mode) return spec;
  WatermarkSpec out = spec;
  double base = BaseWidth(spec);
  if (mode == kMarkPlacePositionRatio) {
    out.offset_x = spec.offset_x / base;
    out.offset_y = spec.offset_y / base;
  } else {
    out.offset_x = spec.offset_x * base;
    out.offset_y = spec.offset_y * base;
  }
  out.position_mode = mode;
  return out;
}

}  // namespace internal
}  // namespace markplace
