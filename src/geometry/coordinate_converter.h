// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_GEOMETRY_COORDINATE_CONVERTER_H_
#define MARKPLACE_GEOMETRY_COORDINATE_CONVERTER_H_

#include "core/watermark_spec.h"
#include "geometry/rect.h"

namespace markplace {
namespace internal {

/// Content scale for `target`: basis / base_canvas_width, where the basis is
/// picked by the adaptive scale mode.  Mode None is exactly 1.
double ComputePreviewScale(const WatermarkSpec& spec, const Size& target);

/// Distance of the overlay from its anchor corner, in target pixels.
/// Pixel offsets are literal; ratio offsets are multiplied by W and H.
PointF ToPixelOffset(const WatermarkSpec& spec, const Size& target);

/// Inverse of ToPixelOffset for one target.  A zero-sized dimension maps to a
/// ratio of 0.
PointF ToStoredOffset(MarkPlacePositionMode mode, const PointF& pixel_offset,
                      const Size& target);

/// Re-express the stored offsets in `mode` using base_canvas_width as the
/// reference size.  Same mode returns the spec unchanged.
WatermarkSpec ConvertPositionMode(const WatermarkSpec& spec,
                                  MarkPlacePositionMode mode);

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_GEOMETRY_COORDINATE_CONVERTER_H_
