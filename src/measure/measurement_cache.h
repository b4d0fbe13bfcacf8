// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_MEASURE_MEASUREMENT_CACHE_H_
#define MARKPLACE_MEASURE_MEASUREMENT_CACHE_H_

#include <cstddef>
#include <string>
#include <unordered_map>

#include "geometry/rect.h"

namespace markplace {
namespace internal {

/// Stabilized content boxes keyed by content signature.  Boxes are stored at
/// scale 1; multiply by a target's preview scale to use them.  Last writer
/// wins.
class MeasurementCache {
 public:
  MeasurementCache() = default;

  MeasurementCache(const MeasurementCache&) = delete;
  MeasurementCache& operator=(const MeasurementCache&) = delete;

  bool Lookup(const std::string& signature, Size* out_unit_box) const;
  void Store(const std::string& signature, const Size& unit_box);
  void Clear() { entries_.clear(); }
  size_t size() const { return entries_.size(); }

 private:
  std::unordered_map<std::string, Size> entries_;
};

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_MEASURE_MEASUREMENT_CACHE_H_
