// Copyright 2026 The markplace Authors
// Text metrics via Pango on a Cairo scratch surface.

#include "measure/text_measurer.h"

#include "core/logger.h"
#include "measure/pango_font.h"

#include <cairo/cairo.h>
#include <pango/pangocairo.h>

namespace markplace {
namespace internal {

class PangoTextMeasurer : public TextMeasurer {
 public:
  PangoTextMeasurer() {
    surface_ = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, 1, 1);
    if (cairo_surface_status(surface_) != CAIRO_STATUS_SUCCESS) {
      MARKPLACE_LOG_ERROR("Cairo scratch surface creation failed");
      return;
    }
    cr_ = cairo_create(surface_);
    layout_ = pango_cairo_create_layout(cr_);
    ConfigureLinearMetrics(layout_);
  }

  ~PangoTextMeasurer() override {
    if (layout_) g_object_unref(layout_);
    if (cr_) cairo_destroy(cr_);
    if (surface_) cairo_surface_destroy(surface_);
  }

  bool IsSupported() const override { return layout_ != nullptr; }

  bool MeasureText(const std::string& text, const std::string& font_family,
                   double font_size_px, TextExtent* out_extent) override {
    if (!layout_ || !out_extent || !(font_size_px > 0.0)) return false;

    PangoFontDescription* desc =
        CreateFontDescription(font_family, font_size_px);
    pango_layout_set_font_description(layout_, desc);
    pango_font_description_free(desc);
    pango_layout_set_text(layout_, text.c_str(), -1);

    PangoRectangle logical;
    pango_layout_get_extents(layout_, nullptr, &logical);
    out_extent->width = static_cast<double>(logical.width) / PANGO_SCALE;
    out_extent->height = static_cast<double>(logical.height) / PANGO_SCALE;
    MARKPLACE_LOG_TRACE("Measured \"{}\" in {} @{}px: {}x{}", text,
                        font_family, font_size_px, out_extent->width,
                        out_extent->height);
    return true;
  }

 private:
  cairo_surface_t* surface_ = nullptr;
  cairo_t* cr_ = nullptr;
  PangoLayout* layout_ = nullptr;
};

std::unique_ptr<TextMeasurer> CreatePlatformTextMeasurer() {
  return std::make_unique<PangoTextMeasurer>();
}

}  // namespace internal
}  // namespace markplace
