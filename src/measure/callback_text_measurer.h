// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_MEASURE_CALLBACK_TEXT_MEASURER_H_
#define MARKPLACE_MEASURE_CALLBACK_TEXT_MEASURER_H_

#include "markplace/markplace.h"
#include "measure/text_measurer.h"

namespace markplace {
namespace internal {

/// Text metrics supplied by the host through a C callback.
class CallbackTextMeasurer : public TextMeasurer {
 public:
  CallbackTextMeasurer(markplace_text_measure_callback_t callback,
                       void* userdata)
      : callback_(callback), userdata_(userdata) {}

  bool IsSupported() const override { return callback_ != nullptr; }

  bool MeasureText(const std::string& text, const std::string& font_family,
                   double font_size_px, TextExtent* out_extent) override;

 private:
  markplace_text_measure_callback_t callback_;
  void* userdata_;
};

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_MEASURE_CALLBACK_TEXT_MEASURER_H_
