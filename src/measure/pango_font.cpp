// Copyright 2026 The markplace Authors

#include "measure/pango_font.h"

namespace markplace {
namespace internal {

PangoFontDescription* CreateFontDescription(const std::string& family,
                                            double size_px) {
  PangoFontDescription* desc = pango_font_description_new();
  pango_font_description_set_family(desc, family.c_str());
  pango_font_description_set_absolute_size(desc, size_px * PANGO_SCALE);
  return desc;
}

void ConfigureLinearMetrics(PangoLayout* layout) {
  PangoContext* context = pango_layout_get_context(layout);
  cairo_font_options_t* options = cairo_font_options_create();
  cairo_font_options_set_hint_metrics(options, CAIRO_HINT_METRICS_OFF);
  cairo_font_options_set_hint_style(options, CAIRO_HINT_STYLE_NONE);
  pango_cairo_context_set_font_options(context, options);
  cairo_font_options_destroy(options);
  pango_layout_context_changed(layout);
}

}  // namespace internal
}  // namespace markplace
