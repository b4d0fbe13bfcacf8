// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_PLACEMENT_PLACEMENT_RESOLVER_H_
#define MARKPLACE_PLACEMENT_PLACEMENT_RESOLVER_H_

#include "core/watermark_spec.h"
#include "geometry/rect.h"

namespace markplace {
namespace internal {

/// Overlay rectangle for one target.
struct Placement {
  Rect rect;
  double scale = 1.0;
  bool visible = false;
  bool provisional = true;
  MarkPlaceAnchor active_anchor = kMarkPlaceAnchorBottomRight;
};

/// Place a `content` box (already at the target's scale) on `target`.
/// The rectangle always satisfies 0 <= x <= max(0, W - w) and likewise for y.
/// The result is marked visible and authoritative; callers override those
/// flags for estimated boxes.
Placement ResolvePlacement(const WatermarkSpec& spec, const Size& target,
                           const Size& content);

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_PLACEMENT_PLACEMENT_RESOLVER_H_
