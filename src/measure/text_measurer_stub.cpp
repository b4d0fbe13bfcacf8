// Copyright 2026 The markplace Authors
//
// Stub text measurer, used when MARKPLACE_ENABLE_PANGO is OFF.  Hosts supply
// metrics through markplace_set_text_measure_callback instead.

#include "measure/text_measurer.h"

namespace markplace {
namespace internal {

class StubTextMeasurer : public TextMeasurer {
 public:
  bool IsSupported() const override { return false; }

  bool MeasureText(const std::string&, const std::string&, double,
                   TextExtent*) override {
    return false;
  }
};

std::unique_ptr<TextMeasurer> CreatePlatformTextMeasurer() {
  return std::make_unique<StubTextMeasurer>();
}

}  // namespace internal
}  // namespace markplace
