// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_CORE_MARKPLACE_CONTEXT_H_
#define MARKPLACE_CORE_MARKPLACE_CONTEXT_H_

#include <memory>
#include <string>

#include "asset/asset_tracker.h"
#include "core/config.h"
#include "core/image.h"
#include "core/watermark_spec.h"
#include "markplace/markplace.h"
#include "measure/measurement_cache.h"
#include "measure/text_measurer.h"
#include "placement/placement_resolver.h"
#include "render/overlay_renderer.h"

namespace markplace {
namespace internal {

/// Internal implementation of the opaque MarkPlaceContext handle.
///
/// Owns the font / icon registry, the measurement cache shared by all
/// sessions, the text metrics backend and the renderer.  Bridges the public
/// C API to the internal C++ implementation.
class MarkPlaceContextImpl {
 public:
  explicit MarkPlaceContextImpl(const EngineConfig& config);
  ~MarkPlaceContextImpl();

  // Non-copyable.
  MarkPlaceContextImpl(const MarkPlaceContextImpl&) = delete;
  MarkPlaceContextImpl& operator=(const MarkPlaceContextImpl&) = delete;

  /// Initialize logging and the text metrics backend.
  bool Initialize();

  const EngineConfig& config() const { return config_; }

  // -- Error state --

  MarkPlaceError last_error() const { return last_error_; }
  const char* last_error_message() const { return last_error_message_.c_str(); }

  void SetError(MarkPlaceError code, const std::string& message);
  void ClearError();

  // -- Assets --

  AssetTracker& assets() { return assets_; }

  // -- Measurement --

  std::shared_ptr<MeasurementCache> measurement_cache() { return cache_; }

  /// Install (or with NULL remove) the host text metrics callback.
  void SetTextMeasureCallback(markplace_text_measure_callback_t callback,
                              void* userdata);

  /// Host callback if installed, else the built-in backend.
  TextMeasurer* text_measurer();

  // -- Rendering --

  /// Get the overlay renderer (lazy-initialized).
  OverlayRenderer* overlay_renderer();

  /// Final output path: measure `spec` for the image size, place it and draw
  /// it.  Fails with NotReady while the font or icon is still loading.
  MarkPlaceError RenderOverlay(Image* image, const WatermarkSpec& spec,
                               Placement* out_placement);

 private:
  EngineConfig config_;
  AssetTracker assets_;
  std::shared_ptr<MeasurementCache> cache_;

  std::unique_ptr<TextMeasurer> platform_text_measurer_;
  std::unique_ptr<TextMeasurer> callback_text_measurer_;

  // Overlay renderer (lazy-initialized).
  std::unique_ptr<OverlayRenderer> overlay_renderer_;

  // Error state (per-context).
  MarkPlaceError last_error_ = kMarkPlaceOk;
  std::string last_error_message_ = "No error";
};

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_CORE_MARKPLACE_CONTEXT_H_
