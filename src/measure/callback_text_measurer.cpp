// Copyright 2026 The markplace Authors

#include "measure/callback_text_measurer.h"

#include <cmath>

#include "core/logger.h"

namespace markplace {
namespace internal {

bool CallbackTextMeasurer::MeasureText(const std::string& text,
                                       const std::string& font_family,
                                       double font_size_px,
                                       TextExtent* out_extent) {
  if (!callback_ || !out_extent) return false;
  double w = 0.0;
  double h = 0.0;
  if (!callback_(text.c_str(), font_family.c_str(), font_size_px, &w, &h,
                 userdata_)) {
    return false;
  }
  if (!std::isfinite(w) || !std::isfinite(h) || w < 0.0 || h < 0.0) {
    MARKPLACE_LOG_WARN("Text measure callback returned invalid size {}x{}", w,
                       h);
    return false;
  }
  out_extent->width = w;
  out_extent->height = h;
  return true;
}

}  // namespace internal
}  // namespace markplace
