// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_CORE_CALLBACK_SINK_H_
#define MARKPLACE_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "markplace/markplace.h"

namespace markplace {
namespace internal {

/// Hands engine log lines to the host (markplace_set_log_callback), e.g. to
/// show measurement or asset warnings in an editor console.  Calls are
/// serialized by the base_sink mutex.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  CallbackSink() = default;

  /// nullptr stops forwarding; stderr output is unaffected.
  void SetCallback(markplace_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(spdlog::sinks::base_sink<std::mutex>::mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;

    spdlog::memory_buf_t formatted;
    spdlog::sinks::base_sink<std::mutex>::formatter_->format(msg, formatted);
    std::string text(formatted.data(), formatted.size());

    callback_(MapLevel(msg.level), text.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  static MarkPlaceLogLevel MapLevel(spdlog::level::level_enum lvl) {
    switch (lvl) {
      case spdlog::level::trace:    return kMarkPlaceLogTrace;
      case spdlog::level::debug:    return kMarkPlaceLogDebug;
      case spdlog::level::info:     return kMarkPlaceLogInfo;
      case spdlog::level::warn:     return kMarkPlaceLogWarn;
      case spdlog::level::err:      return kMarkPlaceLogError;
      case spdlog::level::critical: return kMarkPlaceLogFatal;
      case spdlog::level::off:      return kMarkPlaceLogFatal;
      default:                      return kMarkPlaceLogInfo;
    }
  }

  markplace_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_CORE_CALLBACK_SINK_H_
