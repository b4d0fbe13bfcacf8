// Copyright 2026 The markplace Authors
// Overlay renderer: Cairo + Pango implementation.

#include "render/overlay_renderer.h"

#include <algorithm>
#include <cmath>

#include "core/color_utils.h"
#include "core/logger.h"
#include "measure/pango_font.h"

#include <cairo/cairo.h>
#include <pango/pangocairo.h>

namespace markplace {
namespace internal {

namespace {

void SetSourceArgb(cairo_t* cr, uint32_t argb, double opacity) {
  RgbaF c = ToRgbaF(ApplyOpacity(argb, opacity));
  cairo_set_source_rgba(cr, c.r, c.g, c.b, c.a);
}

void AppendBoxPath(cairo_t* cr, const Rect& box, double radius) {
  double r = EffectiveCornerRadius(box, radius);
  cairo_new_path(cr);
  if (r <= 0.0) {
    cairo_rectangle(cr, box.x, box.y, box.width, box.height);
    return;
  }
  // Clockwise from the top-right corner (y grows down).
  cairo_arc(cr, box.right() - r, box.y + r, r, -M_PI / 2.0, 0.0);
  cairo_arc(cr, box.right() - r, box.bottom() - r, r, 0.0, M_PI / 2.0);
  cairo_arc(cr, box.x + r, box.bottom() - r, r, M_PI / 2.0, M_PI);
  cairo_arc(cr, box.x + r, box.y + r, r, M_PI, 1.5 * M_PI);
  cairo_close_path(cr);
}

// Fit the icon bitmap into its square slot, keeping the aspect ratio.
void PaintIcon(cairo_t* cr, const IconAsset& icon, const Rect& slot,
               double opacity) {
  const Image* bitmap = icon.bitmap.get();
  if (!bitmap || slot.width <= 0.0) return;

  cairo_surface_t* source = cairo_image_surface_create_for_data(
      const_cast<uint8_t*>(bitmap->data()), CAIRO_FORMAT_ARGB32,
      bitmap->width(), bitmap->height(), bitmap->stride());
  if (cairo_surface_status(source) != CAIRO_STATUS_SUCCESS) {
    MARKPLACE_LOG_WARN("Cannot wrap icon bitmap ({}x{})", bitmap->width(),
                       bitmap->height());
    cairo_surface_destroy(source);
    return;
  }

  double fit = slot.width / (std::max)(bitmap->width(), bitmap->height());
  double draw_w = bitmap->width() * fit;
  double draw_h = bitmap->height() * fit;

  cairo_save(cr);
  cairo_translate(cr, slot.x + (slot.width - draw_w) / 2.0,
                  slot.y + (slot.height - draw_h) / 2.0);
  cairo_scale(cr, fit, fit);
  cairo_set_source_surface(cr, source, 0.0, 0.0);
  cairo_pattern_set_filter(cairo_get_source(cr), CAIRO_FILTER_BEST);
  cairo_paint_with_alpha(cr, opacity);
  cairo_restore(cr);
  cairo_surface_destroy(source);
}

}  // namespace

class CairoOverlayRenderer : public OverlayRenderer {
 public:
  CairoOverlayRenderer() = default;
  ~CairoOverlayRenderer() override = default;

  bool IsSupported() const override { return true; }

  bool RenderOverlay(Image* image, const WatermarkSpec& spec,
                     const RenderPlan& plan, const IconAsset* icon) override {
    if (!image) return false;

    // Our Image is premultiplied BGRA8, which is CAIRO_FORMAT_ARGB32 on
    // little-endian hosts.
    cairo_surface_t* surface = cairo_image_surface_create_for_data(
        image->mutable_data(), CAIRO_FORMAT_ARGB32, image->width(),
        image->height(), image->stride());
    if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
      MARKPLACE_LOG_ERROR("Cairo surface creation failed");
      cairo_surface_destroy(surface);
      return false;
    }
    cairo_t* cr = cairo_create(surface);

    const Rect& box = plan.box;
    double radius = spec.corner_radius_px * plan.scale;
    if (spec.rounded_background_enabled && radius <= 0.0)
      radius = (std::min)(box.width, box.height) / 2.0;
    bool rounded = radius > 0.0;
    bool fill = spec.background_enabled || rounded;

    if (fill || spec.border_enabled) {
      AppendBoxPath(cr, box, rounded ? radius : 0.0);
      if (fill) {
        SetSourceArgb(cr, spec.background_color, spec.opacity);
        if (spec.border_enabled) cairo_fill_preserve(cr);
        else cairo_fill(cr);
      }
      if (spec.border_enabled && plan.inputs.border_width_px > 0.0) {
        SetSourceArgb(cr, spec.border_color, spec.opacity);
        cairo_set_line_width(cr, plan.inputs.border_width_px);
        cairo_stroke(cr);
      }
      cairo_new_path(cr);
    }

    if (icon && plan.layout.has_icon) {
      Rect slot = plan.layout.icon_rect;
      slot.x += box.x;
      slot.y += box.y;
      PaintIcon(cr, *icon, slot, spec.opacity);
    }

    PangoLayout* layout = pango_cairo_create_layout(cr);
    ConfigureLinearMetrics(layout);
    PangoFontDescription* desc = CreateFontDescription(
        plan.inputs.font_family, plan.inputs.font_size_px);
    pango_layout_set_font_description(layout, desc);
    pango_font_description_free(desc);
    pango_layout_set_text(layout, plan.inputs.text.c_str(), -1);

    SetSourceArgb(cr, spec.text_color, spec.opacity);
    cairo_move_to(cr, box.x + plan.layout.text_rect.x,
                  box.y + plan.layout.text_rect.y);
    pango_cairo_show_layout(cr, layout);

    g_object_unref(layout);
    cairo_destroy(cr);
    cairo_surface_flush(surface);
    cairo_surface_destroy(surface);
    return true;
  }
};

std::unique_ptr<OverlayRenderer> CreatePlatformOverlayRenderer() {
  return std::make_unique<CairoOverlayRenderer>();
}

}  // namespace internal
}  // namespace markplace
