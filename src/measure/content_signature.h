// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_MEASURE_CONTENT_SIGNATURE_H_
#define MARKPLACE_MEASURE_CONTENT_SIGNATURE_H_

#include <string>

#include "core/watermark_spec.h"

namespace markplace {
namespace internal {

/// Key of everything that shapes the content box, independent of the target
/// size: text, font family, font size, icon settings, decoration flags and
/// border width.  Position, colors and opacity are not part of it.
std::string BuildContentSignature(const WatermarkSpec& spec,
                                  const std::string& font_family);

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_MEASURE_CONTENT_SIGNATURE_H_
