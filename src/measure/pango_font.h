// Copyright 2026 The markplace Authors
//
// Pango helpers shared by the text measurer and the overlay renderer, so both
// lay text out identically.

#ifndef MARKPLACE_MEASURE_PANGO_FONT_H_
#define MARKPLACE_MEASURE_PANGO_FONT_H_

#include <string>

#include <pango/pangocairo.h>

namespace markplace {
namespace internal {

/// Family at an absolute pixel size.  Caller frees with
/// pango_font_description_free().
PangoFontDescription* CreateFontDescription(const std::string& family,
                                            double size_px);

/// Disable metric hinting so extents scale linearly with the font size.
void ConfigureLinearMetrics(PangoLayout* layout);

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_MEASURE_PANGO_FONT_H_
