// Copyright 2026 The markplace Authors

#include "core/logger.h"

#include <mutex>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"

namespace markplace {
namespace internal {

namespace {

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    auto stderr_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_callback_sink = std::make_shared<CallbackSink>();

    spdlog::sinks_init_list sinks = {stderr_sink, g_callback_sink};
    g_logger = std::make_shared<spdlog::logger>("markplace", sinks);

    g_logger->set_pattern("[markplace][%l] %v");
    g_logger->set_level(spdlog::level::info);
    g_logger->flush_on(spdlog::level::warn);
  });
}

std::shared_ptr<spdlog::logger> GetLogger() {
  InitLogger();
  return g_logger;
}

std::shared_ptr<CallbackSink> GetCallbackSink() {
  InitLogger();
  return g_callback_sink;
}

void SetLogLevel(MarkPlaceLogLevel level) {
  InitLogger();
  g_logger->set_level(ToSpdlogLevel(level));
}

spdlog::level::level_enum ToSpdlogLevel(MarkPlaceLogLevel level) {
  switch (level) {
    case kMarkPlaceLogTrace: return spdlog::level::trace;
    case kMarkPlaceLogDebug: return spdlog::level::debug;
    case kMarkPlaceLogInfo:  return spdlog::level::info;
    case kMarkPlaceLogWarn:  return spdlog::level::warn;
    case kMarkPlaceLogError: return spdlog::level::err;
    case kMarkPlaceLogFatal: return spdlog::level::critical;
    default:                 return spdlog::level::info;
  }
}

}  // namespace internal
}  // namespace markplace
