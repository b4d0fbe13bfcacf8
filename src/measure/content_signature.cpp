// Copyright 2026 The markplace Authors

#include "measure/content_signature.h"

#include "spdlog/fmt/fmt.h"

namespace markplace {
namespace internal {

std::string BuildContentSignature(const WatermarkSpec& spec,
                                  const std::string& font_family) {
  // Strings are length-prefixed so separators inside them cannot collide.
  std::string icon = "-";
  if (spec.has_icon()) {
    icon = fmt::format("{}:{}|{}|{}|{}", spec.icon_image_ref.size(),
                       spec.icon_image_ref,
                       static_cast<int>(spec.icon_position), spec.icon_gap_px,
                       spec.icon_scale);
  }
  return fmt::format("t{}:{}|f{}:{}|s{}|i{}|d{}{}{}|b{}", spec.text.size(),
                     spec.text, font_family.size(), font_family,
                     spec.font_size_px, icon,
                     spec.background_enabled ? 1 : 0,
                     spec.border_enabled ? 1 : 0,
                     spec.rounded_background_enabled ? 1 : 0,
                     spec.border_enabled ? spec.border_width_px : 0.0);
}

}  // namespace internal
}  // namespace markplace
