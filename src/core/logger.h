// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_CORE_LOGGER_H_
#define MARKPLACE_CORE_LOGGER_H_

#include <memory>

#include "spdlog/spdlog.h"

#include "markplace/markplace.h"

namespace markplace {
namespace internal {

class CallbackSink;

/// Process-wide "markplace" logger, shared by every context and session.
/// Writes to stderr and to the host sink; created once on first use.
void InitLogger();

std::shared_ptr<spdlog::logger> GetLogger();

/// Sink behind markplace_set_log_callback().
std::shared_ptr<CallbackSink> GetCallbackSink();

/// Backs markplace_set_log_level() and the `log_level` config key.
void SetLogLevel(MarkPlaceLogLevel level);

spdlog::level::level_enum ToSpdlogLevel(MarkPlaceLogLevel level);

}  // namespace internal
}  // namespace markplace

// Engine logging.  Trace covers per-frame measurement chatter, debug covers
// session and job lifecycle, warn covers asset and backend problems.

#define MARKPLACE_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::markplace::internal::GetLogger(), __VA_ARGS__)
#define MARKPLACE_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::markplace::internal::GetLogger(), __VA_ARGS__)
#define MARKPLACE_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::markplace::internal::GetLogger(), __VA_ARGS__)
#define MARKPLACE_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::markplace::internal::GetLogger(), __VA_ARGS__)
#define MARKPLACE_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::markplace::internal::GetLogger(), __VA_ARGS__)
#define MARKPLACE_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::markplace::internal::GetLogger(), __VA_ARGS__)

#endif  // MARKPLACE_CORE_LOGGER_H_
