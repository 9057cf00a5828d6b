// Copyright 2026 The skitch Authors

#include "core/skitch_context.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include "annotation/annotation_renderer.h"
#include "core/logger.h"
#include "history/file_snapshot_store.h"

namespace skitch {
namespace internal {

SkitchContextImpl::SkitchContextImpl() = default;

SkitchContextImpl::~SkitchContextImpl() {
  if (initialized_) {
    SKITCH_LOG_INFO("Closing skitch session ({} pending snapshot writes)",
                    writer_->pending());
  }
}

bool SkitchContextImpl::Initialize(const SkitchOptions* options) {
  if (initialized_) {
    return true;
  }
  InitLogger();

  config_.LoadFromFile(DefaultConfigPath());
  if (options) config_.ApplyOptions(*options);
  if (config_.log_level_configured) SetLogLevel(config_.log_level);

  SKITCH_LOG_INFO("Initializing skitch session...");

  std::string store_dir = config_.ResolvedStoreDir();
  std::unique_ptr<SnapshotStore> store = FileSnapshotStore::Open(store_dir);
  if (!store) {
    SKITCH_LOG_WARN(
        "Snapshot store unavailable at {}; history kept in memory only",
        store_dir);
  } else {
    SKITCH_LOG_DEBUG("Snapshot store at {}", store_dir);
  }

  writer_ = std::make_unique<SnapshotWriter>(
      std::move(store), config_.history.write_queue_capacity,
      config_.history.write_policy);
  cache_.set_capacity(static_cast<size_t>(config_.history.cache_capacity));

  auto renderer = CreatePlatformAnnotationRenderer();
  if (!renderer) {
    SKITCH_LOG_WARN("Annotation renderer unavailable; vector objects will "
                    "not be rendered");
  }
  document_ = std::make_unique<Document>(
      config_.canvas_width, config_.canvas_height, std::move(renderer));
  history_ = std::make_unique<HistoryEngine>(
      document_.get(), &cache_, writer_.get(), &scheduler_, config_.history);
  editor_ = std::make_unique<Editor>(document_.get(), history_.get(),
                                     host_.get(), config_.canvas_width,
                                     config_.canvas_height);

  HistoryResult started = history_->Start();
  if (started != HistoryResult::kOk) {
    SetError(ToSkitchError(started), "Failed to record the initial snapshot");
    return false;
  }

  initialized_ = true;
  SKITCH_LOG_INFO("skitch session initialized ({}x{}, undo depth {})",
                  config_.canvas_width, config_.canvas_height,
                  config_.history.max_undo_steps);
  ClearError();
  return true;
}

void SkitchContextImpl::SetError(SkitchError code,
                                 const std::string& message) {
  last_error_ = code;
  last_error_message_ = message;
  SKITCH_LOG_ERROR("Error {}: {}", static_cast<int>(code), message);
}

void SkitchContextImpl::ClearError() {
  last_error_ = kSkitchOk;
  last_error_message_ = "No error";
}

SkitchError SkitchContextImpl::Report(SkitchError code, const char* what) {
  if (code == kSkitchOk) {
    ClearError();
    return code;
  }
  // Routine outcomes, logged at debug.
  if (code == kSkitchErrorCanceled || code == kSkitchErrorHistoryEmpty ||
      code == kSkitchErrorHistoryBusy) {
    last_error_ = code;
    last_error_message_ = what;
    SKITCH_LOG_DEBUG("{}: error {}", what, static_cast<int>(code));
    return code;
  }
  SetError(code, what);
  return code;
}

int SkitchContextImpl::ProcessEvents(int timeout_ms) {
  if (!initialized_) {
    SetError(kSkitchErrorNotInitialized, "Context not initialized");
    return -1;
  }
  int ran = scheduler_.RunDue();
  if (ran > 0 || timeout_ms <= 0) return ran;

  std::chrono::steady_clock::time_point deadline;
  if (!scheduler_.NextDeadline(&deadline)) return 0;
  auto limit = std::chrono::steady_clock::now() +
               std::chrono::milliseconds(timeout_ms);
  std::this_thread::sleep_until(std::min(deadline, limit));
  return scheduler_.RunDue();
}

void SkitchContextImpl::set_host_shell(std::unique_ptr<HostShell> host) {
  host_ = std::move(host);
  if (editor_) editor_->set_host(host_.get());
}

}  // namespace internal
}  // namespace skitch
