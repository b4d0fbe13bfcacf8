// Copyright 2026 The markplace Authors

#include "geometry/anchor_resolver.h"

#include <algorithm>

namespace markplace {
namespace internal {

MarkPlaceAnchor InferDominantAnchor(const Rect& box, double canvas_width,
                                    double canvas_height,
                                    MarkPlaceAnchor fallback) {
  double half_w = canvas_width / 2.0;
  double half_h = canvas_height / 2.0;
  const Rect quadrants[4] = {
      {0.0, 0.0, half_w, half_h},
      {half_w, 0.0, half_w, half_h},
      {0.0, half_h, half_w, half_h},
      {half_w, half_h, half_w, half_h},
  };

  MarkPlaceAnchor best = fallback;
  double best_area = 0.0;
  for (int i = 0; i < 4; ++i) {
    double area = OverlapArea(box, quadrants[i]);
    if (area > best_area) {
      best_area = area;
      best = kAnchorOrder[i];
    }
  }
  return best;
}

PointF DeriveOffsetsForAnchor(MarkPlaceAnchor anchor, const Rect& box,
                              double canvas_width, double canvas_height) {
  switch (anchor) {
    case kMarkPlaceAnchorTopRight:
      return {canvas_width - box.right(), box.y};
    case kMarkPlaceAnchorBottomLeft:
      return {box.x, canvas_height - box.bottom()};
    case kMarkPlaceAnchorBottomRight:
      return {canvas_width - box.right(), canvas_height - box.bottom()};
    case kMarkPlaceAnchorTopLeft:
    default:
      return {box.x, box.y};
  }
}

PointF AnchoredTopLeft(MarkPlaceAnchor anchor, const PointF& offset,
                       const Size& content, const Size& canvas) {
  double left = offset.x;
  double right = canvas.width - content.width - offset.x;
  double top = offset.y;
  double bottom = canvas.height - content.height - offset.y;
  switch (anchor) {
    case kMarkPlaceAnchorTopRight:
      return {right, top};
    case kMarkPlaceAnchorBottomLeft:
      return {left, bottom};
    case kMarkPlaceAnchorBottomRight:
      return {right, bottom};
    case kMarkPlaceAnchorTopLeft:
    default:
      return {left, top};
  }
}

EdgeDistances ComputeEdgeDistances(const Rect& box, double canvas_width,
                                   double canvas_height) {
  EdgeDistances d;
  d.top = box.y;
  d.left = box.x;
  d.right = (std::max)(0.0, canvas_width - box.right());
  d.bottom = (std::max)(0.0, canvas_height - box.bottom());
  return d;
}

ActiveEdges AnchorActiveEdges(MarkPlaceAnchor anchor) {
  bool top = anchor == kMarkPlaceAnchorTopLeft ||
             anchor == kMarkPlaceAnchorTopRight;
  bool left = anchor == kMarkPlaceAnchorTopLeft ||
              anchor == kMarkPlaceAnchorBottomLeft;
  return ActiveEdges{top, !left, !top, left};
}

}  // namespace internal
}  // namespace markplace
