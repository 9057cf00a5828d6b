// Copyright 2026 The skitch Authors

#ifndef SKITCH_CORE_SKITCH_CONTEXT_H_
#define SKITCH_CORE_SKITCH_CONTEXT_H_

#include <memory>
#include <string>

#include "annotation/document.h"
#include "core/skitch_config.h"
#include "core/task_scheduler.h"
#include "editor/editor.h"
#include "editor/host_shell.h"
#include "history/history_engine.h"
#include "history/snapshot_cache.h"
#include "history/snapshot_writer.h"
#include "skitch/skitch.h"

namespace skitch {
namespace internal {

/// Internal implementation of the opaque SkitchContext handle.
///
/// Owns one editing session (document, history, editor and the snapshot
/// writer thread) and provides the bridge between the public C API and the
/// internal C++ implementation.
class SkitchContextImpl {
 public:
  SkitchContextImpl();
  ~SkitchContextImpl();

  // Non-copyable.
  SkitchContextImpl(const SkitchContextImpl&) = delete;
  SkitchContextImpl& operator=(const SkitchContextImpl&) = delete;

  /// Load settings, open the snapshot store and start the history.
  /// `options` may be null.
  bool Initialize(const SkitchOptions* options);

  bool is_initialized() const { return initialized_; }

  // -- Error state --

  SkitchError last_error() const { return last_error_; }
  const char* last_error_message() const { return last_error_message_.c_str(); }

  void SetError(SkitchError code, const std::string& message);
  void ClearError();

  /// Record `code` (ClearError() for kSkitchOk) and return it.
  SkitchError Report(SkitchError code, const char* what);

  // -- Event pump --

  /// Run due timers, waiting up to `timeout_ms` for the next one.
  int ProcessEvents(int timeout_ms);

  // -- Session parts (valid after Initialize) --

  const SkitchConfig& config() const { return config_; }
  Document* document() { return document_.get(); }
  const Document* document() const { return document_.get(); }
  HistoryEngine* history() { return history_.get(); }
  const HistoryEngine* history() const { return history_.get(); }
  Editor* editor() { return editor_.get(); }
  const Editor* editor() const { return editor_.get(); }
  SnapshotWriter* writer() { return writer_.get(); }

  /// Replace the host services (null = headless).
  void set_host_shell(std::unique_ptr<HostShell> host);

 private:
  // Declaration order is destruction order in reverse: the editor and
  // engine go before the document they listen to, the writer drains last.
  SkitchConfig config_;
  TaskScheduler scheduler_;
  std::unique_ptr<SnapshotWriter> writer_;
  SnapshotCache cache_;
  std::unique_ptr<Document> document_;
  std::unique_ptr<HistoryEngine> history_;
  std::unique_ptr<HostShell> host_;
  std::unique_ptr<Editor> editor_;

  bool initialized_ = false;
  SkitchError last_error_ = kSkitchOk;
  std::string last_error_message_ = "No error";
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_CORE_SKITCH_CONTEXT_H_
