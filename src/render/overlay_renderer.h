// Copyright 2026 The markplace Authors
//
// Abstract overlay renderer interface.

#ifndef MARKPLACE_RENDER_OVERLAY_RENDERER_H_
#define MARKPLACE_RENDER_OVERLAY_RENDERER_H_

#include <memory>

#include "asset/asset_tracker.h"
#include "core/image.h"
#include "core/watermark_spec.h"
#include "geometry/rect.h"
#include "measure/content_layout.h"

namespace markplace {
namespace internal {

/// Everything needed to draw one overlay: where the box goes and how its
/// content is laid out inside it (the same layout the measurer produced).
struct RenderPlan {
  Rect box;
  double scale = 1.0;
  ContentInputs inputs;
  ContentLayout layout;
};

class OverlayRenderer {
 public:
  virtual ~OverlayRenderer() = default;

  /// Check if rendering is supported in this build.
  virtual bool IsSupported() const = 0;

  /// Draw background, border, icon and text onto `image`.
  /// @param icon  Decoded icon, or nullptr to leave the icon slot empty.
  virtual bool RenderOverlay(Image* image, const WatermarkSpec& spec,
                             const RenderPlan& plan,
                             const IconAsset* icon) = 0;

 protected:
  OverlayRenderer() = default;

  OverlayRenderer(const OverlayRenderer&) = delete;
  OverlayRenderer& operator=(const OverlayRenderer&) = delete;
};

/// Create the built-in renderer (Cairo + Pango, or a stub when disabled).
std::unique_ptr<OverlayRenderer> CreatePlatformOverlayRenderer();

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_RENDER_OVERLAY_RENDERER_H_
