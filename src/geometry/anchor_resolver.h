// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_GEOMETRY_ANCHOR_RESOLVER_H_
#define MARKPLACE_GEOMETRY_ANCHOR_RESOLVER_H_

#include "geometry/rect.h"
#include "markplace/markplace.h"

namespace markplace {
namespace internal {

struct EdgeDistances {
  double top = 0.0;
  double right = 0.0;
  double bottom = 0.0;
  double left = 0.0;
};

/// Which two canvas edges an anchor measures its offsets from.
struct ActiveEdges {
  bool top;
  bool right;
  bool bottom;
  bool left;
};

/// Quadrant with the largest overlap with `box`.  Ties go to the earlier
/// anchor in kAnchorOrder; no positive overlap returns `fallback`.
MarkPlaceAnchor InferDominantAnchor(const Rect& box, double canvas_width,
                                    double canvas_height,
                                    MarkPlaceAnchor fallback);

/// Offsets of `box` measured from the corner of `anchor`.
PointF DeriveOffsetsForAnchor(MarkPlaceAnchor anchor, const Rect& box,
                              double canvas_width, double canvas_height);

/// Unclamped top-left of a `content` box whose `anchor` corner sits
/// `offset` pixels from the matching canvas corner.
PointF AnchoredTopLeft(MarkPlaceAnchor anchor, const PointF& offset,
                       const Size& content, const Size& canvas);

/// Distances from each canvas edge; right and bottom are floored at 0.
EdgeDistances ComputeEdgeDistances(const Rect& box, double canvas_width,
                                   double canvas_height);

ActiveEdges AnchorActiveEdges(MarkPlaceAnchor anchor);

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_GEOMETRY_ANCHOR_RESOLVER_H_
