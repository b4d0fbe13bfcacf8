// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_MEASURE_CONTENT_LAYOUT_H_
#define MARKPLACE_MEASURE_CONTENT_LAYOUT_H_

#include <cstddef>
#include <string>

#include "core/watermark_spec.h"
#include "geometry/rect.h"
#include "measure/text_measurer.h"

namespace markplace {
namespace internal {

/// Content parameters at one target's scale.
struct ContentInputs {
  std::string text;
  std::string font_family;
  double font_size_px = 0.0;
  bool with_icon = false;
  MarkPlaceIconPosition icon_position = kMarkPlaceIconLeft;
  double icon_gap_px = 0.0;  // 0 = a quarter of the text height.
  double icon_scale = 1.0;
  bool decorated = false;
  bool bordered = false;
  double border_width_px = 0.0;
};

/// Box of the whole overlay with its parts relative to the box origin.
struct ContentLayout {
  Size box;
  Rect text_rect;
  Rect icon_rect;
  bool has_icon = false;
  double padding = 0.0;
};

/// Scale the spec's sizes by `scale`.  `icon_available` is false when the
/// icon failed to decode, which lays out text only.
ContentInputs ScaleContentInputs(const WatermarkSpec& spec,
                                 const std::string& font_family, double scale,
                                 bool icon_available);

/// Combine a text extent with icon, gap, padding and border.
ContentLayout ComposeContentLayout(const ContentInputs& inputs,
                                   const TextExtent& text,
                                   double padding_ratio);

/// Rough extent used while fonts are still loading.
TextExtent EstimateTextExtent(const std::string& text, double font_size_px,
                              double char_width_ratio);

/// Number of UTF-8 code points in `text`.
size_t CountCodepoints(const std::string& text);

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_MEASURE_CONTENT_LAYOUT_H_
