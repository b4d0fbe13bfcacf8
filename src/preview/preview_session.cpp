// Copyright 2026 The markplace Authors

#include "preview/preview_session.h"

#include "core/logger.h"
#include "geometry/coordinate_converter.h"
#include "measure/content_layout.h"
#include "measure/content_signature.h"

namespace markplace {
namespace internal {

PreviewSession::PreviewSession(
    AssetTracker* assets, std::shared_ptr<MeasurementCache> cache,
    ContentMeasurer::TextMeasurerProvider text_measurer,
    const EngineConfig& config, const WatermarkSpec& spec,
    const std::vector<Size>& targets, size_t main_index)
    : assets_(assets),
      cache_(std::move(cache)),
      config_(config),
      spec_(spec),
      targets_(targets),
      placements_(targets.size()),
      main_index_(main_index < targets.size() ? main_index : 0),
      measurer_(cache_.get(), assets, std::move(text_measurer), config,
                [this](const MeasureResult& r) { OnMeasureResult(r); }),
      drag_([this](const PositionPatch& p) { ApplyPatch(p); }) {
  NormalizeSpec(&spec_);
  subscription_id_ =
      assets_->Subscribe([this](const AssetEvent& e) { OnAssetEvent(e); });
  RequestMeasurement();
  Relayout();
  MARKPLACE_LOG_DEBUG("Preview session opened with {} target(s)",
                      targets_.size());
}

PreviewSession::~PreviewSession() {
  assets_->Unsubscribe(subscription_id_);
  MARKPLACE_LOG_DEBUG("Preview session closed");
}

void PreviewSession::SetSpec(const WatermarkSpec& spec) {
  spec_ = spec;
  NormalizeSpec(&spec_);
  std::string signature =
      BuildContentSignature(spec_, assets_->ResolveFont(spec_.font_key).family);
  if (signature != signature_) {
    RequestMeasurement();
  }
  Relayout();
}

void PreviewSession::Tick() { measurer_.Tick(); }

void PreviewSession::RequestMeasurement() {
  std::string signature =
      BuildContentSignature(spec_, assets_->ResolveFont(spec_.font_key).family);
  // Nobody waits on the superseded signature any more.
  if (!signature_.empty() && signature != signature_)
    measurer_.Cancel(signature_);
  signature_ = signature;
  has_measure_ = false;

  MeasureRequest request;
  request.signature = signature_;
  request.spec = spec_;
  request.scale = targets_.empty()
                      ? 1.0
                      : ComputePreviewScale(spec_, targets_[main_index_]);

  Size unit_box;
  if (measurer_.Request(request, &unit_box)) {
    has_measure_ = true;
    unit_box_ = unit_box;
  }
}

void PreviewSession::OnMeasureResult(const MeasureResult& result) {
  if (result.signature != signature_) {
    MARKPLACE_LOG_TRACE("Dropping stale measurement");
    return;
  }
  has_measure_ = true;
  unit_box_ = result.unit_box;
  Relayout();
}

void PreviewSession::OnAssetEvent(const AssetEvent& event) {
  if (event.kind == AssetEvent::Kind::kFontReady) {
    // A newly registered font can change the fallback resolution.
    std::string signature = BuildContentSignature(
        spec_, assets_->ResolveFont(spec_.font_key).family);
    if (signature != signature_) {
      RequestMeasurement();
      Relayout();
      return;
    }
  } else if (spec_.has_icon() && event.key == spec_.icon_image_ref &&
             !measurer_.HasJob(signature_)) {
    // The icon changed state after its job finished (failed then decoded).
    RequestMeasurement();
    Relayout();
    return;
  }
  measurer_.OnAssetsChanged();
}

Size PreviewSession::EstimateBox(const Size& target) const {
  double scale = ComputePreviewScale(spec_, target);
  bool icon_available = !spec_.has_icon() ||
                        assets_->GetIconState(spec_.icon_image_ref) !=
                            IconState::kFailed;
  ContentInputs inputs = ScaleContentInputs(
      spec_, assets_->ResolveFont(spec_.font_key).family, scale,
      icon_available);
  TextExtent extent = EstimateTextExtent(inputs.text, inputs.font_size_px,
                                         config_.estimate_char_width_ratio);
  return ComposeContentLayout(inputs, extent, config_.decoration_padding_ratio)
      .box;
}

void PreviewSession::Relayout() {
  for (size_t i = 0; i < targets_.size(); ++i) {
    const Size& target = targets_[i];
    if (has_measure_) {
      double scale = ComputePreviewScale(spec_, target);
      Size box{unit_box_.width * scale, unit_box_.height * scale};
      placements_[i] = ResolvePlacement(spec_, target, box);
    } else {
      placements_[i] = ResolvePlacement(spec_, target, EstimateBox(target));
      placements_[i].visible = false;
      placements_[i].provisional = true;
    }
  }
}

void PreviewSession::ApplyPatch(const PositionPatch& patch) {
  spec_.anchor = patch.anchor;
  spec_.offset_x = patch.offset_x;
  spec_.offset_y = patch.offset_y;
  Relayout();
  if (patch_callback_) patch_callback_(patch);
}

DragSurface PreviewSession::MainSurface() const {
  DragSurface surface;
  if (targets_.empty()) return surface;
  const Placement& p = placements_[main_index_];
  surface.canvas = targets_[main_index_];
  surface.overlay = p.rect;
  surface.visible = p.visible;
  surface.anchor = spec_.anchor;
  surface.mode = spec_.position_mode;
  return surface;
}

DragOutcome PreviewSession::HandlePointerEvent(const PointerEvent& event) {
  return drag_.HandlePointerEvent(event, MainSurface());
}

}  // namespace internal
}  // namespace markplace
