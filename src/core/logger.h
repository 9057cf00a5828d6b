// Copyright 2026 The skitch Authors

#ifndef SKITCH_CORE_LOGGER_H_
#define SKITCH_CORE_LOGGER_H_

#include <memory>

#include "spdlog/spdlog.h"

#include "skitch/skitch.h"

namespace skitch {
namespace internal {

class CallbackSink;

/// Initialize the global skitch logger (stderr + callback sink).
/// Safe to call multiple times; subsequent calls are no-ops.
void InitLogger();

/// Get the global skitch spdlog logger instance.
std::shared_ptr<spdlog::logger> GetLogger();

/// Get the global callback sink (used to register/unregister user callback).
std::shared_ptr<CallbackSink> GetCallbackSink();

/// Set the global log level.
void SetLogLevel(SkitchLogLevel level);

/// Map SkitchLogLevel to spdlog::level::level_enum.
spdlog::level::level_enum ToSpdlogLevel(SkitchLogLevel level);

/// Parse "trace" / "debug" / "info" / "warn" / "error" / "fatal".
/// Returns false (leaving *out untouched) for anything else.
bool ParseLogLevel(const char* name, SkitchLogLevel* out);

}  // namespace internal
}  // namespace skitch

// ---------------------------------------------------------------------------
// Convenience macros (internal use only).
// ---------------------------------------------------------------------------

#define SKITCH_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::skitch::internal::GetLogger(), __VA_ARGS__)
#define SKITCH_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::skitch::internal::GetLogger(), __VA_ARGS__)
#define SKITCH_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::skitch::internal::GetLogger(), __VA_ARGS__)
#define SKITCH_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::skitch::internal::GetLogger(), __VA_ARGS__)
#define SKITCH_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::skitch::internal::GetLogger(), __VA_ARGS__)
#define SKITCH_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::skitch::internal::GetLogger(), __VA_ARGS__)

#endif  // SKITCH_CORE_LOGGER_H_
