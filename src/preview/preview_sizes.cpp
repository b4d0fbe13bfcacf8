// Copyright 2026 The markplace Authors

#include "preview/preview_sizes.h"

#include <algorithm>
#include <cmath>

namespace markplace {
namespace internal {

std::vector<Size> SelectPreviewSizes(const std::vector<Size>& sizes) {
  std::vector<Size> candidates;
  for (const Size& s : sizes) {
    if (!(s.height > 0.0) || !(s.width > 0.0)) continue;
    if (std::fabs(s.width / s.height - 1.0) <= kSquareRatioTolerance) continue;
    candidates.push_back(s);
  }
  if (candidates.size() <= kMaxPreviewSizes) return candidates;

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Size& a, const Size& b) {
                     return a.width / a.height < b.width / b.height;
                   });

  std::vector<Size> picked;
  double step = static_cast<double>(candidates.size() - 1) /
                static_cast<double>(kMaxPreviewSizes - 1);
  for (size_t i = 0; i < kMaxPreviewSizes; ++i) {
    size_t index = static_cast<size_t>(std::lround(step * i));
    picked.push_back(candidates[(std::min)(index, candidates.size() - 1)]);
  }
  return picked;
}

}  // namespace internal
}  // namespace markplace
