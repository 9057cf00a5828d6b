// Copyright 2026 The skitch Authors

#ifndef SKITCH_CORE_CALLBACK_SINK_H_
#define SKITCH_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "skitch/skitch.h"

namespace skitch {
namespace internal {

/// Custom spdlog sink that forwards log messages to a user-defined C callback.
///
/// Thread safety: inherits from base_sink which is guarded by Mutex.  The
/// snapshot writer logs from its worker thread, so the callback may run
/// there too.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  CallbackSink() = default;

  /// Set the user callback and optional userdata pointer.
  /// Passing nullptr as callback disables forwarding.
  void SetCallback(skitch_log_callback_t callback, void* userdata) {
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
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
      text.pop_back();
    }

    callback_(MapLevel(msg.level), text.c_str(), userdata_);
  }

  void flush_() override {
    // Nothing to flush for a callback sink.
  }

 private:
  static SkitchLogLevel MapLevel(spdlog::level::level_enum lvl) {
    switch (lvl) {
      case spdlog::level::trace:    return kSkitchLogTrace;
      case spdlog::level::debug:    return kSkitchLogDebug;
      case spdlog::level::info:     return kSkitchLogInfo;
      case spdlog::level::warn:     return kSkitchLogWarn;
      case spdlog::level::err:      return kSkitchLogError;
      case spdlog::level::critical: return kSkitchLogFatal;
      case spdlog::level::off:      return kSkitchLogFatal;
      default:                      return kSkitchLogInfo;
    }
  }

  skitch_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_CORE_CALLBACK_SINK_H_
