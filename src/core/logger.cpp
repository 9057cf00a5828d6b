// Copyright 2026 The skitch Authors

#include "core/logger.h"

#include <cstring>
#include <mutex>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"

namespace skitch {
namespace internal {

namespace {

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    // Create sinks: stderr (colored) + callback.
    auto stderr_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_callback_sink = std::make_shared<CallbackSink>();

    spdlog::sinks_init_list sinks = {stderr_sink, g_callback_sink};
    g_logger = std::make_shared<spdlog::logger>("skitch", sinks);

    // Default pattern: [skitch][level] message
    g_logger->set_pattern("[skitch][%l] %v");
    g_logger->set_level(spdlog::level::info);

    // Warnings include history data-loss reports; get them out promptly.
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

void SetLogLevel(SkitchLogLevel level) {
  InitLogger();
  g_logger->set_level(ToSpdlogLevel(level));
}

spdlog::level::level_enum ToSpdlogLevel(SkitchLogLevel level) {
  switch (level) {
    case kSkitchLogTrace: return spdlog::level::trace;
    case kSkitchLogDebug: return spdlog::level::debug;
    case kSkitchLogInfo:  return spdlog::level::info;
    case kSkitchLogWarn:  return spdlog::level::warn;
    case kSkitchLogError: return spdlog::level::err;
    case kSkitchLogFatal: return spdlog::level::critical;
    default:              return spdlog::level::info;
  }
}

bool ParseLogLevel(const char* name, SkitchLogLevel* out) {
  if (!name || !out) return false;
  static const struct {
    const char* name;
    SkitchLogLevel level;
  } kLevels[] = {
      {"trace", kSkitchLogTrace}, {"debug", kSkitchLogDebug},
      {"info", kSkitchLogInfo},   {"warn", kSkitchLogWarn},
      {"error", kSkitchLogError}, {"fatal", kSkitchLogFatal},
  };
  for (const auto& entry : kLevels) {
    if (std::strcmp(name, entry.name) == 0) {
      *out = entry.level;
      return true;
    }
  }
  return false;
}

}  // namespace internal
}  // namespace skitch
