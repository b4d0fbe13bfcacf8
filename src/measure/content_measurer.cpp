// Copyright 2026 The markplace Authors

#include "measure/content_measurer.h"

#include <cmath>

#include "core/logger.h"
#include "measure/content_layout.h"

namespace markplace {
namespace internal {

ContentMeasurer::ContentMeasurer(MeasurementCache* cache,
                                 const AssetTracker* assets,
                                 TextMeasurerProvider text_measurer,
                                 const EngineConfig& config,
                                 ResultCallback on_result)
    : cache_(cache),
      assets_(assets),
      text_measurer_(std::move(text_measurer)),
      config_(config),
      on_result_(std::move(on_result)) {}

bool ContentMeasurer::Request(const MeasureRequest& request,
                              Size* out_unit_box) {
  // Cached boxes include the icon; a failed icon lays out text only.
  bool icon_failed =
      request.spec.has_icon() &&
      assets_->GetIconState(request.spec.icon_image_ref) == IconState::kFailed;
  if (!icon_failed && cache_ &&
      cache_->Lookup(request.signature, out_unit_box)) {
    MARKPLACE_LOG_TRACE("Measurement cache hit");
    return true;
  }
  if (jobs_.count(request.signature)) return false;

  Job& job = jobs_[request.signature];
  job.request = request;
  if (!(job.request.scale > 0.0) || !std::isfinite(job.request.scale))
    job.request.scale = 1.0;

  std::vector<MeasureResult> results;
  TryFirstSample(&job, &results);
  Emit(results);
  return false;
}

void ContentMeasurer::Cancel(const std::string& signature) {
  if (jobs_.erase(signature)) MARKPLACE_LOG_TRACE("Measurement job cancelled");
}

void ContentMeasurer::OnAssetsChanged() {
  std::vector<MeasureResult> results;
  for (auto& entry : jobs_) {
    if (!entry.second.sampled) TryFirstSample(&entry.second, &results);
  }
  Emit(results);
}

void ContentMeasurer::Tick() {
  std::vector<MeasureResult> results;
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    Job& job = it->second;
    if (!job.sampled) {
      TryFirstSample(&job, &results);
      ++it;
      continue;
    }

    ++job.frames;
    Size sample;
    if (TakeSample(&job, &sample) == SampleStatus::kOk) {
      bool stable =
          std::fabs(sample.width - job.last.width) <=
              config_.stabilize_tolerance_px / job.request.scale &&
          std::fabs(sample.height - job.last.height) <=
              config_.stabilize_tolerance_px / job.request.scale;
      job.last = sample;
      if (stable) {
        if (job.cacheable && cache_) cache_->Store(it->first, sample);
        MARKPLACE_LOG_DEBUG("Measurement settled after {} frame(s): {}x{}",
                            job.frames, sample.width, sample.height);
        results.push_back({it->first, sample, true});
        it = jobs_.erase(it);
        continue;
      }
      results.push_back({it->first, sample, false});
    }

    if (job.frames >= config_.max_stabilize_frames) {
      MARKPLACE_LOG_DEBUG("Measurement did not settle in {} frames; keeping "
                          "last sample uncached",
                          job.frames);
      results.push_back({it->first, job.last, true});
      it = jobs_.erase(it);
      continue;
    }
    ++it;
  }
  Emit(results);
}

bool ContentMeasurer::HasJob(const std::string& signature) const {
  return jobs_.count(signature) != 0;
}

ContentMeasurer::SampleStatus ContentMeasurer::TakeSample(Job* job,
                                                          Size* out_unit_box) {
  const WatermarkSpec& spec = job->request.spec;
  ResolvedFont font = assets_->ResolveFont(spec.font_key);
  if (!font.ready) return SampleStatus::kNotReady;

  bool icon_available = false;
  if (spec.has_icon()) {
    IconState state = assets_->GetIconState(spec.icon_image_ref);
    if (state == IconState::kPending) return SampleStatus::kNotReady;
    icon_available = state == IconState::kDecoded;
    // A failed icon lays out text only; that box is never cached.
    job->cacheable = icon_available;
  }

  TextMeasurer* measurer = text_measurer_ ? text_measurer_() : nullptr;
  if (!measurer || !measurer->IsSupported()) {
    if (!job->warned) {
      MARKPLACE_LOG_WARN("No text measurement backend available");
      job->warned = true;
    }
    return SampleStatus::kNotReady;
  }

  double scale = job->request.scale;
  ContentInputs inputs =
      ScaleContentInputs(spec, font.family, scale, icon_available);
  TextExtent extent;
  if (!measurer->MeasureText(inputs.text, inputs.font_family,
                             inputs.font_size_px, &extent)) {
    if (!job->warned) {
      MARKPLACE_LOG_WARN("Text measurement failed for font \"{}\"",
                         inputs.font_family);
      job->warned = true;
    }
    return SampleStatus::kFailed;
  }

  ContentLayout layout =
      ComposeContentLayout(inputs, extent, config_.decoration_padding_ratio);
  out_unit_box->width = layout.box.width / scale;
  out_unit_box->height = layout.box.height / scale;
  return SampleStatus::kOk;
}

bool ContentMeasurer::TryFirstSample(Job* job,
                                     std::vector<MeasureResult>* results) {
  Size sample;
  if (TakeSample(job, &sample) != SampleStatus::kOk) return false;
  job->sampled = true;
  job->frames = 0;
  job->last = sample;
  ++measure_count_;
  results->push_back({job->request.signature, sample, false});
  return true;
}

void ContentMeasurer::Emit(const std::vector<MeasureResult>& results) {
  if (!on_result_) return;
  for (const MeasureResult& result : results) on_result_(result);
}

}  // namespace internal
}  // namespace markplace
