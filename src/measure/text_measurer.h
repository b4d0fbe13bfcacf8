// Copyright 2026 The markplace Authors
//
// Abstract text metrics backend.

#ifndef MARKPLACE_MEASURE_TEXT_MEASURER_H_
#define MARKPLACE_MEASURE_TEXT_MEASURER_H_

#include <memory>
#include <string>

namespace markplace {
namespace internal {

/// Logical extent of a laid-out text run, in pixels.
struct TextExtent {
  double width = 0.0;
  double height = 0.0;
};

class TextMeasurer {
 public:
  virtual ~TextMeasurer() = default;

  /// Check if text can be measured in this build.
  virtual bool IsSupported() const = 0;

  /// Lay out `text` (UTF-8) in `font_family` at an absolute pixel size.
  /// @return false if the text could not be measured.
  virtual bool MeasureText(const std::string& text,
                           const std::string& font_family, double font_size_px,
                           TextExtent* out_extent) = 0;

 protected:
  TextMeasurer() = default;

  TextMeasurer(const TextMeasurer&) = delete;
  TextMeasurer& operator=(const TextMeasurer&) = delete;
};

/// Create the built-in text measurer (Pango, or a stub when disabled).
std::unique_ptr<TextMeasurer> CreatePlatformTextMeasurer();

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_MEASURE_TEXT_MEASURER_H_
