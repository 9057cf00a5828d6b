// Copyright 2026 The skitch Authors

#ifndef SKITCH_HISTORY_HISTORY_ENGINE_H_
#define SKITCH_HISTORY_HISTORY_ENGINE_H_

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "core/skitch_config.h"
#include "core/task_scheduler.h"
#include "history/document_surface.h"
#include "history/snapshot.h"
#include "history/snapshot_cache.h"
#include "history/snapshot_writer.h"

namespace skitch {
namespace internal {

enum class HistoryState {
  kIdle,
  kDebouncing,  // A change is waiting out the debounce window.
  kCapturing,
  kRestoring,   // Undo/redo restored; waiting for the settle delay.
  kReplacing,   // Wholesale document replacement in progress.
};

enum class HistoryResult {
  kOk,
  kUnchanged,        // Capture matched the top snapshot.
  kBusy,             // Locked by a restore, capture or replacement.
  kNothingToUndo,
  kNothingToRedo,
  kSnapshotMissing,  // Not in cache or store; stacks rolled back.
  kRestoreFailed,    // Surface rejected the snapshot; stacks rolled back.
  kFailed,           // Serialization or replacement failed.
};

const char* HistoryStateName(HistoryState state);

/// Persistent, de-duplicated undo/redo history over a DocumentSurface.
///
/// Every document change (re)starts a debounce timer; when it fires the
/// document is serialized and pushed onto the undo stack unless it equals
/// the current top.  Undo and redo move ids between the stacks and restore
/// the surface, then hold the history locked for the settle delay so that
/// the restoration's own change events are not captured.
///
/// Single-threaded: all calls, and every task it posts on the scheduler,
/// run on the thread pumping the scheduler.  Only store I/O happens
/// elsewhere (inside the SnapshotWriter).
class HistoryEngine : public ChangeListener {
 public:
  using Mutator = std::function<bool()>;
  using CaptureCallback = std::function<void(SnapshotId id)>;

  /// All collaborators must outlive the engine.  Registers itself as a
  /// change listener on `surface`.
  HistoryEngine(DocumentSurface* surface, SnapshotCache* cache,
                SnapshotWriter* writer, TaskScheduler* scheduler,
                const HistoryConfig& config);
  ~HistoryEngine() override;

  HistoryEngine(const HistoryEngine&) = delete;
  HistoryEngine& operator=(const HistoryEngine&) = delete;

  /// Begin a session: wipe the store and record the initial snapshot.
  /// Switches to cache-only mode when the writer has no store.
  HistoryResult Start();

  /// Serialize the document and push it if it differs from the top.
  HistoryResult Capture();

  /// Cancel a pending debounce and capture now.  kUnchanged if nothing
  /// was pending and the document matches the top.
  HistoryResult Flush();

  HistoryResult Undo();
  HistoryResult Redo();

  /// Drop both stacks, reset the id counter, clear the cache and wipe the
  /// store.  Refused while a capture or restore is in progress.
  HistoryResult ClearHistory();

  /// Run `mutator` with history locked, then reset history to the new
  /// document.  If the mutator returns false (or throws) history is left
  /// untouched.
  HistoryResult ReplaceDocument(const Mutator& mutator);

  /// Ask the store to drop every snapshot no stack references.
  void CollectGarbage();

  void OnDocumentChanged(ChangeKind kind) override;

  /// Called after every successful push.
  void set_capture_callback(CaptureCallback cb) {
    capture_callback_ = std::move(cb);
  }

  // -- Observers --

  const std::vector<SnapshotId>& undo_stack() const { return undo_; }
  const std::vector<SnapshotId>& redo_stack() const { return redo_; }
  int undo_depth() const { return static_cast<int>(undo_.size()); }
  int redo_depth() const { return static_cast<int>(redo_.size()); }
  SnapshotId top_id() const { return undo_.empty() ? 0 : undo_.back(); }
  bool CanUndo() const { return undo_.size() > 1; }
  bool CanRedo() const { return !redo_.empty(); }
  HistoryState state() const { return state_; }
  bool IsLocked() const {
    return state_ != HistoryState::kIdle &&
           state_ != HistoryState::kDebouncing;
  }
  bool degraded() const { return degraded_; }
  bool redo_clear_suppressed() const { return suppress_redo_clear_; }

 private:
  /// Cache, then writer/store.  A store hit is cached.
  bool Resolve(SnapshotId id, Snapshot* out);

  /// Drop an unreferenced id from the cache and schedule its store delete.
  void Release(SnapshotId id);

  void ResetStacks();
  void CancelDebounce();
  void ScheduleSettle();
  void Settle();
  bool RestoreSurface(const Snapshot& snapshot);

  enum class Direction { kUndo, kRedo };
  HistoryResult Step(Direction dir);

  DocumentSurface* surface_;
  SnapshotCache* cache_;
  SnapshotWriter* writer_;
  TaskScheduler* scheduler_;
  HistoryConfig config_;

  std::vector<SnapshotId> undo_;
  std::vector<SnapshotId> redo_;
  SnapshotId next_id_ = 0;  // Last assigned id.
  HistoryState state_ = HistoryState::kIdle;
  bool suppress_redo_clear_ = false;
  bool degraded_ = false;
  int captures_since_gc_ = 0;

  TaskScheduler::TaskId debounce_task_ = 0;
  TaskScheduler::TaskId settle_task_ = 0;
  CaptureCallback capture_callback_;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_HISTORY_HISTORY_ENGINE_H_
