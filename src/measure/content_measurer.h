// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_MEASURE_CONTENT_MEASURER_H_
#define MARKPLACE_MEASURE_CONTENT_MEASURER_H_

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "asset/asset_tracker.h"
#include "core/config.h"
#include "core/watermark_spec.h"
#include "geometry/rect.h"
#include "measure/measurement_cache.h"
#include "measure/text_measurer.h"

namespace markplace {
namespace internal {

struct MeasureRequest {
  std::string signature;
  WatermarkSpec spec;
  double scale = 1.0;  // Scale the sample is laid out at.
};

struct MeasureResult {
  std::string signature;
  Size unit_box;         // Box at scale 1.
  bool settled = false;  // No further samples follow for this signature.
};

/// Readiness-gated, frame-stabilized content measurement.
///
/// A job is created per distinct signature.  Once its font is ready and its
/// icon (if any) is decoded or failed, the first sample is taken at once and
/// reported.  Every Tick() takes another sample; two consecutive samples
/// within the tolerance settle the job and write the cache.  A job that never
/// settles is abandoned after max_stabilize_frames ticks, uncached.
class ContentMeasurer {
 public:
  using ResultCallback = std::function<void(const MeasureResult&)>;
  using TextMeasurerProvider = std::function<TextMeasurer*()>;

  ContentMeasurer(MeasurementCache* cache, const AssetTracker* assets,
                  TextMeasurerProvider text_measurer,
                  const EngineConfig& config, ResultCallback on_result);

  ContentMeasurer(const ContentMeasurer&) = delete;
  ContentMeasurer& operator=(const ContentMeasurer&) = delete;

  /// Returns true and the cached unit box on a cache hit.  Otherwise makes
  /// sure a job for the signature exists (joining one in flight) and returns
  /// false; results arrive through the callback, possibly before this
  /// returns.
  bool Request(const MeasureRequest& request, Size* out_unit_box);

  /// Drop the job for `signature`, if any.  No result is reported for it.
  void Cancel(const std::string& signature);

  /// Font or icon state changed: start jobs that became ready.
  void OnAssetsChanged();

  /// One animation frame.
  void Tick();

  bool HasJob(const std::string& signature) const;
  size_t job_count() const { return jobs_.size(); }

  /// Number of jobs that took at least one sample.
  int measure_count() const { return measure_count_; }

 private:
  struct Job {
    MeasureRequest request;
    bool sampled = false;
    bool cacheable = true;
    bool warned = false;
    int frames = 0;
    Size last;
  };

  enum class SampleStatus { kOk, kNotReady, kFailed };

  SampleStatus TakeSample(Job* job, Size* out_unit_box);
  bool TryFirstSample(Job* job, std::vector<MeasureResult>* results);
  void Emit(const std::vector<MeasureResult>& results);

  MeasurementCache* cache_;
  const AssetTracker* assets_;
  TextMeasurerProvider text_measurer_;
  EngineConfig config_;
  ResultCallback on_result_;
  std::map<std::string, Job> jobs_;
  int measure_count_ = 0;
};

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_MEASURE_CONTENT_MEASURER_H_
