// Copyright 2026 The markplace Authors

#include "core/markplace_context.h"

#include <utility>

#include "core/logger.h"
#include "geometry/coordinate_converter.h"
#include "measure/callback_text_measurer.h"
#include "measure/content_layout.h"

namespace markplace {
namespace internal {

MarkPlaceContextImpl::MarkPlaceContextImpl(const EngineConfig& config)
    : config_(config),
      assets_(config.default_font_key, config.default_font_family),
      cache_(std::make_shared<MeasurementCache>()) {}

MarkPlaceContextImpl::~MarkPlaceContextImpl() = default;

bool MarkPlaceContextImpl::Initialize() {
  InitLogger();

  MARKPLACE_LOG_INFO("Initializing markplace context...");

  platform_text_measurer_ = CreatePlatformTextMeasurer();
  if (!platform_text_measurer_ || !platform_text_measurer_->IsSupported()) {
    MARKPLACE_LOG_INFO("Built-in text metrics unavailable; install a text "
                       "measure callback");
  }

  MARKPLACE_LOG_DEBUG("Default font: {} (\"{}\")", config_.default_font_key,
                      config_.default_font_family);
  ClearError();
  return true;
}

void MarkPlaceContextImpl::SetError(MarkPlaceError code,
                                    const std::string& message) {
  last_error_ = code;
  last_error_message_ = message;
  MARKPLACE_LOG_ERROR("Error {}: {}", static_cast<int>(code), message);
}

void MarkPlaceContextImpl::ClearError() {
  last_error_ = kMarkPlaceOk;
  last_error_message_ = "No error";
}

void MarkPlaceContextImpl::SetTextMeasureCallback(
    markplace_text_measure_callback_t callback, void* userdata) {
  if (callback) {
    callback_text_measurer_ =
        std::make_unique<CallbackTextMeasurer>(callback, userdata);
    MARKPLACE_LOG_DEBUG("Host text measure callback installed");
  } else {
    callback_text_measurer_.reset();
    MARKPLACE_LOG_DEBUG("Host text measure callback removed");
  }
}

TextMeasurer* MarkPlaceContextImpl::text_measurer() {
  if (callback_text_measurer_) return callback_text_measurer_.get();
  return platform_text_measurer_.get();
}

OverlayRenderer* MarkPlaceContextImpl::overlay_renderer() {
  if (!overlay_renderer_) {
    overlay_renderer_ = CreatePlatformOverlayRenderer();
  }
  return overlay_renderer_.get();
}

MarkPlaceError MarkPlaceContextImpl::RenderOverlay(Image* image,
                                                   const WatermarkSpec& spec_in,
                                                   Placement* out_placement) {
  if (!image) {
    SetError(kMarkPlaceErrorInvalidParam, "image is NULL");
    return kMarkPlaceErrorInvalidParam;
  }
  WatermarkSpec spec = spec_in;
  NormalizeSpec(&spec);

  OverlayRenderer* renderer = overlay_renderer();
  if (!renderer || !renderer->IsSupported()) {
    SetError(kMarkPlaceErrorNotSupported,
             "Overlay rendering is not supported in this build");
    return kMarkPlaceErrorNotSupported;
  }

  ResolvedFont font = assets_.ResolveFont(spec.font_key);
  if (!font.ready) {
    SetError(kMarkPlaceErrorNotReady, "Font not ready: " + font.key);
    return kMarkPlaceErrorNotReady;
  }

  const IconAsset* icon = nullptr;
  if (spec.has_icon()) {
    if (assets_.GetIconState(spec.icon_image_ref) == IconState::kPending) {
      SetError(kMarkPlaceErrorNotReady,
               "Icon not decoded: " + spec.icon_image_ref);
      return kMarkPlaceErrorNotReady;
    }
    icon = assets_.FindDecodedIcon(spec.icon_image_ref);
  }

  TextMeasurer* measurer = text_measurer();
  if (!measurer || !measurer->IsSupported()) {
    SetError(kMarkPlaceErrorNotSupported, "No text measurement backend");
    return kMarkPlaceErrorNotSupported;
  }

  Size target{static_cast<double>(image->width()),
              static_cast<double>(image->height())};
  RenderPlan plan;
  plan.scale = ComputePreviewScale(spec, target);
  plan.inputs = ScaleContentInputs(spec, font.family, plan.scale,
                                   icon != nullptr);
  TextExtent extent;
  if (!measurer->MeasureText(plan.inputs.text, plan.inputs.font_family,
                             plan.inputs.font_size_px, &extent)) {
    SetError(kMarkPlaceErrorRenderFailed, "Text measurement failed");
    return kMarkPlaceErrorRenderFailed;
  }
  plan.layout =
      ComposeContentLayout(plan.inputs, extent, config_.decoration_padding_ratio);

  Placement placement = ResolvePlacement(spec, target, plan.layout.box);
  plan.box = placement.rect;

  if (!renderer->RenderOverlay(image, spec, plan, icon)) {
    SetError(kMarkPlaceErrorRenderFailed, "Overlay rendering failed");
    return kMarkPlaceErrorRenderFailed;
  }

  MARKPLACE_LOG_DEBUG("Overlay rendered at ({}, {}) {}x{}", placement.rect.x,
                      placement.rect.y, placement.rect.width,
                      placement.rect.height);
  if (out_placement) *out_placement = placement;
  ClearError();
  return kMarkPlaceOk;
}

}  // namespace internal
}  // namespace markplace
