// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_PREVIEW_PREVIEW_SIZES_H_
#define MARKPLACE_PREVIEW_PREVIEW_SIZES_H_

#include <vector>

#include "geometry/rect.h"

namespace markplace {
namespace internal {

constexpr double kSquareRatioTolerance = 0.05;
constexpr size_t kMaxPreviewSizes = 4;

/// Pick the preview sizes worth showing next to the square base canvas.
/// Near-square sizes (|w/h - 1| <= 0.05) and sizes without height are
/// dropped.  Up to four sizes are returned in input order; with more, four
/// are spread evenly across the range of aspect ratios.
std::vector<Size> SelectPreviewSizes(const std::vector<Size>& sizes);

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_PREVIEW_PREVIEW_SIZES_H_
