// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_PREVIEW_PREVIEW_SESSION_H_
#define MARKPLACE_PREVIEW_PREVIEW_SESSION_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "asset/asset_tracker.h"
#include "core/config.h"
#include "core/watermark_spec.h"
#include "drag/drag_controller.h"
#include "measure/content_measurer.h"
#include "measure/measurement_cache.h"
#include "placement/placement_resolver.h"

namespace markplace {
namespace internal {

/// One watermark spec previewed on several targets at once.
///
/// Every target shares a single measurement (the content box is measured
/// once at unit scale and multiplied by each target's preview scale).  The
/// main target accepts drag input; patches are folded into the spec and
/// forwarded to the patch callback.
class PreviewSession {
 public:
  using PatchCallback = std::function<void(const PositionPatch&)>;

  PreviewSession(AssetTracker* assets, std::shared_ptr<MeasurementCache> cache,
                 ContentMeasurer::TextMeasurerProvider text_measurer,
                 const EngineConfig& config, const WatermarkSpec& spec,
                 const std::vector<Size>& targets, size_t main_index);
  ~PreviewSession();

  PreviewSession(const PreviewSession&) = delete;
  PreviewSession& operator=(const PreviewSession&) = delete;

  /// Replace the spec.  Re-measures only if the content signature changed.
  void SetSpec(const WatermarkSpec& spec);
  const WatermarkSpec& spec() const { return spec_; }

  /// Advance measurement stabilization by one frame.
  void Tick();

  size_t target_count() const { return targets_.size(); }
  size_t main_index() const { return main_index_; }
  const Size& target(size_t index) const { return targets_[index]; }
  const Placement& placement(size_t index) const { return placements_[index]; }

  const std::string& signature() const { return signature_; }
  bool has_measurement() const { return has_measure_; }
  int measure_count() const { return measurer_.measure_count(); }

  void set_patch_callback(PatchCallback callback) {
    patch_callback_ = std::move(callback);
  }

  DragOutcome HandlePointerEvent(const PointerEvent& event);
  bool is_dragging() const { return drag_.state() == DragState::kDragging; }

 private:
  void RequestMeasurement();
  void OnMeasureResult(const MeasureResult& result);
  void OnAssetEvent(const AssetEvent& event);
  void Relayout();
  Size EstimateBox(const Size& target) const;
  void ApplyPatch(const PositionPatch& patch);
  DragSurface MainSurface() const;

  AssetTracker* assets_;
  std::shared_ptr<MeasurementCache> cache_;
  EngineConfig config_;
  WatermarkSpec spec_;
  std::vector<Size> targets_;
  std::vector<Placement> placements_;
  size_t main_index_;

  std::string signature_;
  bool has_measure_ = false;
  Size unit_box_;

  ContentMeasurer measurer_;
  DragController drag_;
  PatchCallback patch_callback_;
  int subscription_id_ = 0;
};

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_PREVIEW_PREVIEW_SESSION_H_
