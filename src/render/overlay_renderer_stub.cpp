// Copyright 2026 The markplace Authors
//
// Stub overlay renderer, used when MARKPLACE_ENABLE_PANGO is OFF.

#include "render/overlay_renderer.h"

namespace markplace {
namespace internal {

class StubOverlayRenderer : public OverlayRenderer {
 public:
  bool IsSupported() const override { return false; }

  bool RenderOverlay(Image*, const WatermarkSpec&, const RenderPlan&,
                     const IconAsset*) override {
    return false;
  }
};

std::unique_ptr<OverlayRenderer> CreatePlatformOverlayRenderer() {
  return std::make_unique<StubOverlayRenderer>();
}

}  // namespace internal
}  // namespace markplace
