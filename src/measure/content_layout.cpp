// Copyright 2026 The markplace Authors

#include "measure/content_layout.h"

#include <algorithm>

namespace markplace {
namespace internal {

ContentInputs ScaleContentInputs(const WatermarkSpec& spec,
                                 const std::string& font_family, double scale,
                                 bool icon_available) {
  ContentInputs in;
  in.text = spec.text;
  in.font_family = font_family;
  in.font_size_px = spec.font_size_px * scale;
  in.with_icon = spec.has_icon() && icon_available;
  in.icon_position = spec.icon_position;
  in.icon_gap_px = spec.icon_gap_px * scale;
  in.icon_scale = spec.icon_scale;
  in.decorated = spec.has_decoration();
  in.bordered = spec.border_enabled;
  in.border_width_px = spec.border_enabled ? spec.border_width_px * scale : 0.0;
  return in;
}

ContentLayout ComposeContentLayout(const ContentInputs& inputs,
                                   const TextExtent& text,
                                   double padding_ratio) {
  ContentLayout out;
  double tw = (std::max)(0.0, text.width);
  double th = (std::max)(0.0, text.height);

  double icon = 0.0;
  double gap = 0.0;
  if (inputs.with_icon) {
    icon = th * inputs.icon_scale;
    gap = inputs.icon_gap_px > 0.0 ? inputs.icon_gap_px : th / 4.0;
    out.has_icon = true;
  }

  double inner_w = tw;
  double inner_h = th;
  bool horizontal = inputs.icon_position == kMarkPlaceIconLeft ||
                    inputs.icon_position == kMarkPlaceIconRight;
  if (out.has_icon) {
    if (horizontal) {
      inner_w = tw + gap + icon;
      inner_h = (std::max)(th, icon);
    } else {
      inner_w = (std::max)(tw, icon);
      inner_h = th + gap + icon;
    }
  }

  out.padding = inputs.decorated ? th * padding_ratio : 0.0;
  double inset = out.padding + (inputs.bordered ? inputs.border_width_px : 0.0);
  out.box.width = inner_w + 2.0 * inset;
  out.box.height = inner_h + 2.0 * inset;

  // Text and icon slots, centered on the cross axis.
  out.text_rect = {inset, inset + (inner_h - th) / 2.0, tw, th};
  if (!out.has_icon) return out;

  switch (inputs.icon_position) {
    case kMarkPlaceIconRight:
      out.icon_rect = {inset + tw + gap, inset + (inner_h - icon) / 2.0, icon,
                       icon};
      break;
    case kMarkPlaceIconTop:
      out.icon_rect = {inset + (inner_w - icon) / 2.0, inset, icon, icon};
      out.text_rect = {inset + (inner_w - tw) / 2.0, inset + icon + gap, tw,
                       th};
      break;
    case kMarkPlaceIconBottom:
      out.icon_rect = {inset + (inner_w - icon) / 2.0, inset + th + gap, icon,
                       icon};
      out.text_rect = {inset + (inner_w - tw) / 2.0, inset, tw, th};
      break;
    case kMarkPlaceIconLeft:
    default:
      out.icon_rect = {inset, inset + (inner_h - icon) / 2.0, icon, icon};
      out.text_rect.x = inset + icon + gap;
      break;
  }
  return out;
}

size_t CountCodepoints(const std::string& text) {
  size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

TextExtent EstimateTextExtent(const std::string& text, double font_size_px,
                              double char_width_ratio) {
  double chars = static_cast<double>(
      (std::max)(CountCodepoints(text), static_cast<size_t>(1)));
  return TextExtent{chars * font_size_px * char_width_ratio, font_size_px};
}

}  // namespace internal
}  // namespace markplace
