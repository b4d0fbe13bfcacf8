// Copyright 2026 The markplace Authors

#include "measure/measurement_cache.h"

namespace markplace {
namespace internal {

bool MeasurementCache::Lookup(const std::string& signature,
                              Size* out_unit_box) const {
  auto it = entries_.find(signature);
  if (it == entries_.end()) return false;
  if (out_unit_box) *out_unit_box = it->second;
  return true;
}

void MeasurementCache::Store(const std::string& signature,
                             const Size& unit_box) {
  entries_[signature] = unit_box;
}

}  // namespace internal
}  // namespace markplace
