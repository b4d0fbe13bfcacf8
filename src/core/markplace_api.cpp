// Copyright 2026 The markplace Authors
//
// This file implements all public C API functions declared in markplace.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "markplace/markplace.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include "asset/asset_tracker.h"
#include "core/callback_sink.h"
#include "core/color_utils.h"
#include "core/config.h"
#include "core/image.h"
#include "core/logger.h"
#include "core/markplace_context.h"
#include "core/watermark_spec.h"
#include "geometry/anchor_resolver.h"
#include "geometry/coordinate_converter.h"
#include "geometry/rect.h"
#include "measure/content_signature.h"
#include "placement/placement_resolver.h"
#include "preview/preview_session.h"
#include "preview/preview_sizes.h"

using markplace::internal::AssetTracker;
using markplace::internal::DragOutcome;
using markplace::internal::EngineConfig;
using markplace::internal::FontDefinition;
using markplace::internal::Image;
using markplace::internal::MarkPlaceContextImpl;
using markplace::internal::Placement;
using markplace::internal::PointerEvent;
using markplace::internal::PointF;
using markplace::internal::PositionPatch;
using markplace::internal::PreviewSession;
using markplace::internal::Rect;
using markplace::internal::Size;
using markplace::internal::WatermarkSpec;

// ---------------------------------------------------------------------------
// The opaque MarkPlaceContext struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct MarkPlaceContext {
  MarkPlaceContextImpl impl;

  explicit MarkPlaceContext(const EngineConfig& config) : impl(config) {}
};

// ---------------------------------------------------------------------------
// The opaque MarkPlaceSession struct wraps PreviewSession.
// ---------------------------------------------------------------------------
struct MarkPlaceSession {
  MarkPlaceContext* ctx;  // Parent context for error reporting (non-owning).
  std::unique_ptr<PreviewSession> session;
  markplace_patch_callback_t patch_callback = nullptr;
  void* patch_userdata = nullptr;
};

// ---------------------------------------------------------------------------
// The opaque MarkPlaceImage struct wraps the C++ Image object.
// ---------------------------------------------------------------------------
struct MarkPlaceImage {
  std::unique_ptr<Image> impl;

  explicit MarkPlaceImage(std::unique_ptr<Image> image)
      : impl(std::move(image)) {}
};

// Convert public MarkPlaceSpec to internal WatermarkSpec.
static WatermarkSpec ToInternal(const MarkPlaceSpec* s) {
  WatermarkSpec out;
  if (!s) return out;
  out.text = s->text ? s->text : "";
  out.font_key = s->font_key ? s->font_key : "";
  out.font_size_px = s->font_size_px;
  out.opacity = s->opacity;
  out.position_mode = s->position_mode;
  out.anchor = s->anchor;
  out.offset_x = s->offset_x;
  out.offset_y = s->offset_y;
  out.icon_enabled = s->icon_enabled != 0;
  out.icon_image_ref = s->icon_image_ref ? s->icon_image_ref : "";
  out.icon_position = s->icon_position;
  out.icon_gap_px = s->icon_gap_px;
  out.icon_scale = s->icon_scale;
  out.border_enabled = s->border_enabled != 0;
  out.background_enabled = s->background_enabled != 0;
  out.rounded_background_enabled = s->rounded_background_enabled != 0;
  out.border_color = s->border_color;
  out.background_color = s->background_color;
  out.text_color = s->text_color;
  out.border_width_px = s->border_width_px;
  out.corner_radius_px = s->corner_radius_px;
  out.base_canvas_width = s->base_canvas_width;
  out.adaptive_scale_mode = s->adaptive_scale_mode;
  return out;
}

// Copy the numeric fields of `in` into `out`; strings point into `in`.
static void ToPublic(const WatermarkSpec& in, MarkPlaceSpec* out) {
  out->text = in.text.c_str();
  out->font_key = in.font_key.empty() ? nullptr : in.font_key.c_str();
  out->font_size_px = in.font_size_px;
  out->opacity = in.opacity;
  out->position_mode = in.position_mode;
  out->anchor = in.anchor;
  out->offset_x = in.offset_x;
  out->offset_y = in.offset_y;
  out->icon_enabled = in.icon_enabled ? 1 : 0;
  out->icon_image_ref =
      in.icon_image_ref.empty() ? nullptr : in.icon_image_ref.c_str();
  out->icon_position = in.icon_position;
  out->icon_gap_px = in.icon_gap_px;
  out->icon_scale = in.icon_scale;
  out->border_enabled = in.border_enabled ? 1 : 0;
  out->background_enabled = in.background_enabled ? 1 : 0;
  out->rounded_background_enabled = in.rounded_background_enabled ? 1 : 0;
  out->border_color = in.border_color;
  out->background_color = in.background_color;
  out->text_color = in.text_color;
  out->border_width_px = in.border_width_px;
  out->corner_radius_px = in.corner_radius_px;
  out->base_canvas_width = in.base_canvas_width;
  out->adaptive_scale_mode = in.adaptive_scale_mode;
}

static Size ToInternal(const MarkPlaceTarget& t) { return Size{t.width, t.height}; }

static Rect ToInternal(const MarkPlaceRect& r) {
  return Rect{r.x, r.y, r.width, r.height};
}

static void ToPublic(const Placement& p, MarkPlacePlacement* out) {
  out->x = p.rect.x;
  out->y = p.rect.y;
  out->width = p.rect.width;
  out->height = p.rect.height;
  out->scale = p.scale;
  out->visible = p.visible ? 1 : 0;
  out->provisional = p.provisional ? 1 : 0;
  out->active_anchor = p.active_anchor;
}

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

MarkPlaceContext* markplace_context_create(void) {
  return markplace_context_create_with_config(nullptr);
}

MarkPlaceContext* markplace_context_create_with_config(
    const MarkPlaceConfig* config) {
  EngineConfig engine_config;
  if (config) {
    engine_config = markplace::internal::EngineConfigFromPublic(*config);
    markplace::internal::SetLogLevel(engine_config.log_level);
  }

  auto* ctx = new (std::nothrow) MarkPlaceContext(engine_config);
  if (!ctx) return nullptr;

  if (!ctx->impl.Initialize()) {
    delete ctx;
    return nullptr;
  }
  return ctx;
}

void markplace_context_destroy(MarkPlaceContext* ctx) { delete ctx; }

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

MarkPlaceError markplace_get_last_error(const MarkPlaceContext* ctx) {
  if (!ctx) return kMarkPlaceErrorInvalidParam;
  return ctx->impl.last_error();
}

const char* markplace_get_last_error_message(const MarkPlaceContext* ctx) {
  if (!ctx) return "Invalid context (NULL)";
  return ctx->impl.last_error_message();
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

static void FillPublicConfig(const EngineConfig& in, MarkPlaceConfig* out) {
  out->stabilize_tolerance_px = in.stabilize_tolerance_px;
  out->max_stabilize_frames = in.max_stabilize_frames;
  out->estimate_char_width_ratio = in.estimate_char_width_ratio;
  out->decoration_padding_ratio = in.decoration_padding_ratio;
  out->default_font_key = markplace::internal::kDefaultFontKey;
  out->default_font_family = markplace::internal::kDefaultFontFamily;
  out->log_level = in.log_level;
}

void markplace_config_init_default(MarkPlaceConfig* out_config) {
  if (!out_config) return;
  FillPublicConfig(EngineConfig(), out_config);
}

MarkPlaceError markplace_config_load_file(const char* path,
                                          MarkPlaceConfig* out_config) {
  if (!out_config) return kMarkPlaceErrorInvalidParam;

  // Backing storage for the string fields handed out below.
  static std::string font_key_storage;
  static std::string font_family_storage;

  std::string file =
      (path && path[0]) ? path : markplace::internal::DefaultConfigPath();
  EngineConfig config;
  if (!markplace::internal::LoadEngineConfig(file, &config))
    return kMarkPlaceErrorConfigFailed;

  FillPublicConfig(config, out_config);
  font_key_storage = config.default_font_key;
  font_family_storage = config.default_font_family;
  out_config->default_font_key = font_key_storage.c_str();
  out_config->default_font_family = font_family_storage.c_str();
  return kMarkPlaceOk;
}

// ---------------------------------------------------------------------------
// Watermark spec helpers
// ---------------------------------------------------------------------------

void markplace_spec_init_default(MarkPlaceSpec* out_spec,
                                 const char* font_key) {
  if (!out_spec) return;
  static const WatermarkSpec kDefaults;
  ToPublic(kDefaults, out_spec);
  out_spec->font_key = font_key;
}

void markplace_spec_normalize(MarkPlaceSpec* spec) {
  if (!spec) return;
  WatermarkSpec normalized = ToInternal(spec);
  markplace::internal::NormalizeSpec(&normalized);
  // Keep the caller's string pointers.
  const char* text = spec->text;
  const char* font_key = spec->font_key;
  const char* icon_ref = spec->icon_image_ref;
  ToPublic(normalized, spec);
  spec->text = text;
  spec->font_key = font_key;
  spec->icon_image_ref = icon_ref;
}

MarkPlaceError markplace_spec_convert_position_mode(
    MarkPlaceSpec* spec, MarkPlacePositionMode new_mode) {
  if (!spec || !markplace::internal::IsValidPositionMode(new_mode))
    return kMarkPlaceErrorInvalidParam;
  WatermarkSpec converted =
      markplace::internal::ConvertPositionMode(ToInternal(spec), new_mode);
  spec->position_mode = converted.position_mode;
  spec->offset_x = converted.offset_x;
  spec->offset_y = converted.offset_y;
  return kMarkPlaceOk;
}

int markplace_spec_content_signature(const MarkPlaceSpec* spec, char* buf,
                                     int buf_size) {
  if (!spec || (buf_size > 0 && !buf) || buf_size < 0) return -1;
  WatermarkSpec s = ToInternal(spec);
  std::string family =
      s.font_key.empty() ? markplace::internal::kDefaultFontFamily : s.font_key;
  std::string signature = markplace::internal::BuildContentSignature(s, family);
  if (buf_size > 0) {
    size_t n = (std::min)(signature.size(), static_cast<size_t>(buf_size - 1));
    std::memcpy(buf, signature.data(), n);
    buf[n] = '\0';
  }
  return static_cast<int>(signature.size());
}

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

double markplace_compute_preview_scale(const MarkPlaceSpec* spec,
                                       const MarkPlaceTarget* target) {
  if (!spec || !target) return 0.0;
  WatermarkSpec s = ToInternal(spec);
  markplace::internal::NormalizeSpec(&s);
  return markplace::internal::ComputePreviewScale(s, ToInternal(*target));
}

MarkPlaceError markplace_compute_pixel_offset(const MarkPlaceSpec* spec,
                                              const MarkPlaceTarget* target,
                                              double* out_dx, double* out_dy) {
  if (!spec || !target || !out_dx || !out_dy)
    return kMarkPlaceErrorInvalidParam;
  PointF offset =
      markplace::internal::ToPixelOffset(ToInternal(spec), ToInternal(*target));
  *out_dx = offset.x;
  *out_dy = offset.y;
  return kMarkPlaceOk;
}

double markplace_rect_overlap_area(const MarkPlaceRect* a,
                                   const MarkPlaceRect* b) {
  if (!a || !b) return 0.0;
  return markplace::internal::OverlapArea(ToInternal(*a), ToInternal(*b));
}

MarkPlaceAnchor markplace_infer_dominant_anchor(const MarkPlaceRect* box,
                                                double canvas_width,
                                                double canvas_height,
                                                MarkPlaceAnchor fallback) {
  if (!box) return fallback;
  return markplace::internal::InferDominantAnchor(
      ToInternal(*box), canvas_width, canvas_height, fallback);
}

MarkPlaceError markplace_derive_offsets(MarkPlaceAnchor anchor,
                                        const MarkPlaceRect* box,
                                        double canvas_width,
                                        double canvas_height,
                                        double* out_offset_x,
                                        double* out_offset_y) {
  if (!box || !out_offset_x || !out_offset_y ||
      !markplace::internal::IsValidAnchor(anchor))
    return kMarkPlaceErrorInvalidParam;
  PointF offsets = markplace::internal::DeriveOffsetsForAnchor(
      anchor, ToInternal(*box), canvas_width, canvas_height);
  *out_offset_x = offsets.x;
  *out_offset_y = offsets.y;
  return kMarkPlaceOk;
}

MarkPlaceError markplace_compute_edge_distances(
    const MarkPlaceRect* box, double canvas_width, double canvas_height,
    MarkPlaceEdgeDistances* out_distances) {
  if (!box || !out_distances) return kMarkPlaceErrorInvalidParam;
  markplace::internal::EdgeDistances d =
      markplace::internal::ComputeEdgeDistances(ToInternal(*box), canvas_width,
                                                canvas_height);
  out_distances->top = d.top;
  out_distances->right = d.right;
  out_distances->bottom = d.bottom;
  out_distances->left = d.left;
  return kMarkPlaceOk;
}

MarkPlaceError markplace_anchor_active_edges(MarkPlaceAnchor anchor,
                                             MarkPlaceActiveEdges* out_edges) {
  if (!out_edges || !markplace::internal::IsValidAnchor(anchor))
    return kMarkPlaceErrorInvalidParam;
  markplace::internal::ActiveEdges e =
      markplace::internal::AnchorActiveEdges(anchor);
  out_edges->top = e.top ? 1 : 0;
  out_edges->right = e.right ? 1 : 0;
  out_edges->bottom = e.bottom ? 1 : 0;
  out_edges->left = e.left ? 1 : 0;
  return kMarkPlaceOk;
}

MarkPlaceError markplace_resolve_placement(const MarkPlaceSpec* spec,
                                           const MarkPlaceTarget* target,
                                           double content_width,
                                           double content_height,
                                           MarkPlacePlacement* out_placement) {
  if (!spec || !target || !out_placement) return kMarkPlaceErrorInvalidParam;
  WatermarkSpec s = ToInternal(spec);
  markplace::internal::NormalizeSpec(&s);
  Placement p = markplace::internal::ResolvePlacement(
      s, ToInternal(*target), Size{content_width, content_height});
  ToPublic(p, out_placement);
  return kMarkPlaceOk;
}

int markplace_select_preview_sizes(const MarkPlaceTarget* sizes, int count,
                                   MarkPlaceTarget* out_targets, int max_out) {
  if (count < 0 || (count > 0 && !sizes) || max_out < 0 ||
      (max_out > 0 && !out_targets))
    return -1;
  std::vector<Size> in;
  in.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) in.push_back(ToInternal(sizes[i]));
  std::vector<Size> picked = markplace::internal::SelectPreviewSizes(in);
  int n = (std::min)(static_cast<int>(picked.size()), max_out);
  for (int i = 0; i < n; ++i) {
    out_targets[i].width = picked[i].width;
    out_targets[i].height = picked[i].height;
  }
  return n;
}

// ---------------------------------------------------------------------------
// Fonts and icons
// ---------------------------------------------------------------------------

MarkPlaceError markplace_font_register(MarkPlaceContext* ctx,
                                       const char* font_key,
                                       const char* font_family,
                                       const char* display_name, int ready) {
  if (!ctx) return kMarkPlaceErrorInvalidParam;
  if (!font_key || !font_key[0]) {
    ctx->impl.SetError(kMarkPlaceErrorInvalidParam, "font_key is empty");
    return kMarkPlaceErrorInvalidParam;
  }
  FontDefinition def;
  def.key = font_key;
  def.family = font_family ? font_family : "";
  def.display_name = display_name ? display_name : "";
  def.ready = ready != 0;
  ctx->impl.assets().RegisterFont(def);
  ctx->impl.ClearError();
  return kMarkPlaceOk;
}

MarkPlaceError markplace_font_notify_ready(MarkPlaceContext* ctx,
                                           const char* font_key) {
  if (!ctx) return kMarkPlaceErrorInvalidParam;
  if (!font_key || !ctx->impl.assets().NotifyFontReady(font_key)) {
    ctx->impl.SetError(kMarkPlaceErrorInvalidParam, "Unknown font key");
    return kMarkPlaceErrorInvalidParam;
  }
  ctx->impl.ClearError();
  return kMarkPlaceOk;
}

int markplace_font_is_ready(MarkPlaceContext* ctx, const char* font_key) {
  if (!ctx) return 0;
  return ctx->impl.assets().IsFontReady(font_key ? font_key : "") ? 1 : 0;
}

MarkPlaceError markplace_icon_notify_decoded(MarkPlaceContext* ctx,
                                             const char* icon_ref, int width,
                                             int height, const uint8_t* bgra,
                                             int stride) {
  if (!ctx) return kMarkPlaceErrorInvalidParam;
  if (!icon_ref || !icon_ref[0] || width <= 0 || height <= 0) {
    ctx->impl.SetError(kMarkPlaceErrorInvalidParam,
                       "Invalid icon reference or size");
    return kMarkPlaceErrorInvalidParam;
  }
  std::unique_ptr<Image> bitmap;
  if (bgra) {
    bitmap = Image::CopyFrom(width, height, stride, bgra);
    if (!bitmap) {
      ctx->impl.SetError(kMarkPlaceErrorInvalidParam,
                         "Icon pixel buffer rejected");
      return kMarkPlaceErrorInvalidParam;
    }
  }
  ctx->impl.assets().NotifyIconDecoded(icon_ref, width, height,
                                       std::move(bitmap));
  ctx->impl.ClearError();
  return kMarkPlaceOk;
}

MarkPlaceError markplace_icon_notify_failed(MarkPlaceContext* ctx,
                                            const char* icon_ref) {
  if (!ctx) return kMarkPlaceErrorInvalidParam;
  if (!icon_ref || !icon_ref[0]) {
    ctx->impl.SetError(kMarkPlaceErrorInvalidParam, "icon_ref is empty");
    return kMarkPlaceErrorInvalidParam;
  }
  ctx->impl.assets().NotifyIconFailed(icon_ref);
  ctx->impl.ClearError();
  return kMarkPlaceOk;
}

void markplace_set_text_measure_callback(
    MarkPlaceContext* ctx, markplace_text_measure_callback_t callback,
    void* userdata) {
  if (!ctx) return;
  ctx->impl.SetTextMeasureCallback(callback, userdata);
}

int markplace_text_measure_is_supported(MarkPlaceContext* ctx) {
  if (!ctx) return 0;
  auto* measurer = ctx->impl.text_measurer();
  return (measurer && measurer->IsSupported()) ? 1 : 0;
}

// ---------------------------------------------------------------------------
// Measurement cache
// ---------------------------------------------------------------------------

int markplace_cache_size(MarkPlaceContext* ctx) {
  if (!ctx) return -1;
  return static_cast<int>(ctx->impl.measurement_cache()->size());
}

void markplace_cache_clear(MarkPlaceContext* ctx) {
  if (!ctx) return;
  ctx->impl.measurement_cache()->Clear();
  MARKPLACE_LOG_DEBUG("Measurement cache cleared");
}

// ---------------------------------------------------------------------------
// Preview sessions
// ---------------------------------------------------------------------------

MarkPlaceSession* markplace_session_create(MarkPlaceContext* ctx,
                                           const MarkPlaceSpec* spec,
                                           const MarkPlaceTarget* targets,
                                           int target_count, int main_index) {
  if (!ctx) return nullptr;
  if (!spec || !targets || target_count <= 0) {
    ctx->impl.SetError(kMarkPlaceErrorInvalidParam,
                       "spec or targets is NULL / empty");
    return nullptr;
  }
  if (main_index < 0 || main_index >= target_count) {
    ctx->impl.SetError(kMarkPlaceErrorInvalidParam,
                       "main_index out of range");
    return nullptr;
  }

  std::vector<Size> sizes;
  sizes.reserve(static_cast<size_t>(target_count));
  for (int i = 0; i < target_count; ++i) sizes.push_back(ToInternal(targets[i]));

  auto* session = new (std::nothrow) MarkPlaceSession();
  if (!session) {
    ctx->impl.SetError(kMarkPlaceErrorOutOfMemory, "Session allocation failed");
    return nullptr;
  }
  session->ctx = ctx;
  MarkPlaceContextImpl* impl = &ctx->impl;
  session->session = std::make_unique<PreviewSession>(
      &impl->assets(), impl->measurement_cache(),
      [impl]() { return impl->text_measurer(); }, impl->config(),
      ToInternal(spec), sizes, static_cast<size_t>(main_index));
  session->session->set_patch_callback([session](const PositionPatch& p) {
    if (!session->patch_callback) return;
    MarkPlacePositionPatch out;
    out.anchor = p.anchor;
    out.offset_x = p.offset_x;
    out.offset_y = p.offset_y;
    session->patch_callback(&out, session->patch_userdata);
  });
  ctx->impl.ClearError();
  return session;
}

void markplace_session_destroy(MarkPlaceSession* session) { delete session; }

MarkPlaceError markplace_session_set_spec(MarkPlaceSession* session,
                                          const MarkPlaceSpec* spec) {
  if (!session) return kMarkPlaceErrorInvalidParam;
  if (!spec) {
    session->ctx->impl.SetError(kMarkPlaceErrorInvalidParam, "spec is NULL");
    return kMarkPlaceErrorInvalidParam;
  }
  session->session->SetSpec(ToInternal(spec));
  return kMarkPlaceOk;
}

MarkPlaceError markplace_session_get_spec(MarkPlaceSession* session,
                                          MarkPlaceSpec* out_spec) {
  if (!session || !out_spec) return kMarkPlaceErrorInvalidParam;
  ToPublic(session->session->spec(), out_spec);
  return kMarkPlaceOk;
}

void markplace_session_tick(MarkPlaceSession* session) {
  if (!session) return;
  session->session->Tick();
}

int markplace_session_target_count(MarkPlaceSession* session) {
  if (!session) return -1;
  return static_cast<int>(session->session->target_count());
}

MarkPlaceError markplace_session_get_placement(
    MarkPlaceSession* session, int index, MarkPlacePlacement* out_placement) {
  if (!session) return kMarkPlaceErrorInvalidParam;
  if (!out_placement || index < 0 ||
      index >= static_cast<int>(session->session->target_count())) {
    session->ctx->impl.SetError(kMarkPlaceErrorInvalidParam,
                                "Target index out of range");
    return kMarkPlaceErrorInvalidParam;
  }
  ToPublic(session->session->placement(static_cast<size_t>(index)),
           out_placement);
  return kMarkPlaceOk;
}

int markplace_session_measure_count(MarkPlaceSession* session) {
  if (!session) return -1;
  return session->session->measure_count();
}

void markplace_session_set_patch_callback(MarkPlaceSession* session,
                                          markplace_patch_callback_t callback,
                                          void* userdata) {
  if (!session) return;
  session->patch_callback = callback;
  session->patch_userdata = userdata;
}

MarkPlaceError markplace_session_pointer_event(
    MarkPlaceSession* session, const MarkPlacePointerEvent* event) {
  if (!session) return kMarkPlaceErrorInvalidParam;
  if (!event) {
    session->ctx->impl.SetError(kMarkPlaceErrorInvalidParam, "event is NULL");
    return kMarkPlaceErrorInvalidParam;
  }
  PointerEvent e;
  e.type = event->type;
  e.pointer_id = event->pointer_id;
  e.position = PointF{event->x, event->y};
  if (session->session->HandlePointerEvent(e) == DragOutcome::kRejected)
    return kMarkPlaceErrorDragRejected;
  return kMarkPlaceOk;
}

int markplace_session_is_dragging(MarkPlaceSession* session) {
  if (!session) return 0;
  return session->session->is_dragging() ? 1 : 0;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

int markplace_render_is_supported(MarkPlaceContext* ctx) {
  if (!ctx) return 0;
  auto* renderer = ctx->impl.overlay_renderer();
  return (renderer && renderer->IsSupported()) ? 1 : 0;
}

MarkPlaceImage* markplace_image_create(int width, int height, uint32_t argb) {
  auto image = Image::Create(width, height);
  if (!image) return nullptr;
  image->Fill(argb);
  return new (std::nothrow) MarkPlaceImage(std::move(image));
}

void markplace_image_destroy(MarkPlaceImage* image) { delete image; }

int markplace_image_get_width(const MarkPlaceImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->width();
}

int markplace_image_get_height(const MarkPlaceImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->height();
}

int markplace_image_get_stride(const MarkPlaceImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->stride();
}

const uint8_t* markplace_image_get_data(const MarkPlaceImage* image) {
  if (!image || !image->impl) return nullptr;
  return image->impl->data();
}

MarkPlaceError markplace_render_overlay(MarkPlaceContext* ctx,
                                        MarkPlaceImage* image,
                                        const MarkPlaceSpec* spec,
                                        MarkPlacePlacement* out_placement) {
  if (!ctx) return kMarkPlaceErrorInvalidParam;
  if (!image || !image->impl || !spec) {
    ctx->impl.SetError(kMarkPlaceErrorInvalidParam, "image or spec is NULL");
    return kMarkPlaceErrorInvalidParam;
  }
  Placement placement;
  MarkPlaceError err =
      ctx->impl.RenderOverlay(image->impl.get(), ToInternal(spec), &placement);
  if (err == kMarkPlaceOk && out_placement) ToPublic(placement, out_placement);
  return err;
}

// ---------------------------------------------------------------------------
// Color utilities
// ---------------------------------------------------------------------------

MarkPlaceError markplace_color_from_hex(const char* hex, uint32_t* out_argb) {
  if (!hex || !out_argb) return kMarkPlaceErrorInvalidParam;
  return markplace::internal::ColorFromHex(hex, out_argb)
             ? kMarkPlaceOk
             : kMarkPlaceErrorInvalidParam;
}

uint32_t markplace_color_apply_opacity(uint32_t argb, double opacity) {
  return markplace::internal::ApplyOpacity(argb, opacity);
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* markplace_version_string(void) { return MARKPLACE_VERSION_STRING; }

int markplace_version_major(void) { return MARKPLACE_VERSION_MAJOR; }
int markplace_version_minor(void) { return MARKPLACE_VERSION_MINOR; }
int markplace_version_patch(void) { return MARKPLACE_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void markplace_set_log_level(MarkPlaceLogLevel level) {
  markplace::internal::SetLogLevel(level);
}

void markplace_set_log_callback(markplace_log_callback_t callback,
                                void* userdata) {
  auto sink = markplace::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void markplace_log(MarkPlaceLogLevel level, const char* message) {
  if (!message) return;
  auto logger = markplace::internal::GetLogger();
  if (logger) {
    logger->log(markplace::internal::ToSpdlogLevel(level), "{}", message);
  }
}
