// Copyright 2026 The skitch Authors

#include "history/history_engine.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <unordered_set>

#include "core/logger.h"

namespace skitch {
namespace internal {

const char* HistoryStateName(HistoryState state) {
  switch (state) {
    case HistoryState::kIdle:
      return "idle";
    case HistoryState::kDebouncing:
      return "debouncing";
    case HistoryState::kCapturing:
      return "capturing";
    case HistoryState::kRestoring:
      return "restoring";
    case HistoryState::kReplacing:
      return "replacing";
  }
  return "unknown";
}

HistoryEngine::HistoryEngine(DocumentSurface* surface, SnapshotCache* cache,
                             SnapshotWriter* writer, TaskScheduler* scheduler,
                             const HistoryConfig& config)
    : surface_(surface),
      cache_(cache),
      writer_(writer),
      scheduler_(scheduler),
      config_(config) {
  if (config_.max_undo_steps < 1) config_.max_undo_steps = 1;
  surface_->AddChangeListener(this);
}

HistoryEngine::~HistoryEngine() {
  surface_->RemoveChangeListener(this);
  if (debounce_task_) scheduler_->Cancel(debounce_task_);
  if (settle_task_) scheduler_->Cancel(settle_task_);
}

// ---------------------------------------------------------------------------
// Session lifecycle
// ---------------------------------------------------------------------------

HistoryResult HistoryEngine::Start() {
  if (!writer_->has_store()) {
    degraded_ = true;
    // Cache-only: keep every snapshot either stack can reference.
    size_t needed = static_cast<size_t>(config_.max_undo_steps) * 2;
    cache_->set_capacity((std::max)(cache_->capacity(), needed));
    SKITCH_LOG_WARN("Snapshot store unavailable; history is cache-only "
                    "({} entries)",
                    cache_->capacity());
  }
  CancelDebounce();
  ResetStacks();
  writer_->Clear();
  state_ = HistoryState::kIdle;
  SKITCH_LOG_INFO("History initialized (max {} steps, cache {})",
                  config_.max_undo_steps, cache_->capacity());
  return Capture();
}

// ---------------------------------------------------------------------------
// Capture
// ---------------------------------------------------------------------------

HistoryResult HistoryEngine::Capture() {
  if (IsLocked()) {
    SKITCH_LOG_DEBUG("Capture skipped: history {}", HistoryStateName(state_));
    return HistoryResult::kBusy;
  }
  CancelDebounce();
  state_ = HistoryState::kCapturing;

  Snapshot snapshot;
  bool ok = false;
  try {
    ok = surface_->Serialize(&snapshot);
  } catch (const std::exception& e) {
    SKITCH_LOG_ERROR("Capture aborted: serialization threw: {}", e.what());
    state_ = HistoryState::kIdle;
    return HistoryResult::kFailed;
  }
  if (!ok) {
    SKITCH_LOG_ERROR("Capture aborted: document could not be serialized");
    state_ = HistoryState::kIdle;
    return HistoryResult::kFailed;
  }

  if (!undo_.empty()) {
    Snapshot top;
    if (Resolve(undo_.back(), &top)) {
      if (top == snapshot) {
        state_ = HistoryState::kIdle;
        SKITCH_LOG_TRACE("Capture unchanged (top {})", undo_.back());
        return HistoryResult::kUnchanged;
      }
    } else {
      SKITCH_LOG_WARN("Top snapshot {} unavailable for comparison",
                      undo_.back());
    }
  }

  if (!suppress_redo_clear_ && !redo_.empty()) {
    for (SnapshotId id : redo_) Release(id);
    redo_.clear();
  }

  SnapshotId id = ++next_id_;
  undo_.push_back(id);
  cache_->Put(id, snapshot);
  writer_->Put(id, snapshot);

  while (undo_.size() > static_cast<size_t>(config_.max_undo_steps)) {
    SnapshotId oldest = undo_.front();
    undo_.erase(undo_.begin());
    Release(oldest);
  }

  state_ = HistoryState::kIdle;
  SKITCH_LOG_DEBUG("History saved (id {}, {} bytes). Undo: {}, Redo: {}", id,
                   snapshot.size(), undo_.size(), redo_.size());

  if (config_.gc_interval > 0 && ++captures_since_gc_ >= config_.gc_interval) {
    CollectGarbage();
  }
  if (capture_callback_) capture_callback_(id);
  return HistoryResult::kOk;
}

HistoryResult HistoryEngine::Flush() { return Capture(); }

void HistoryEngine::OnDocumentChanged(ChangeKind kind) {
  if (IsLocked()) {
    SKITCH_LOG_TRACE("Change {} ignored: history {}", static_cast<int>(kind),
                     HistoryStateName(state_));
    return;
  }
  if (kind == ChangeKind::kTextEditExited) {
    Flush();
    return;
  }
  CancelDebounce();
  state_ = HistoryState::kDebouncing;
  debounce_task_ = scheduler_->PostDelayed(
      std::chrono::milliseconds(config_.debounce_ms), [this] {
        debounce_task_ = 0;
        Capture();
      });
}

// ---------------------------------------------------------------------------
// Undo / redo
// ---------------------------------------------------------------------------

HistoryResult HistoryEngine::Undo() { return Step(Direction::kUndo); }

HistoryResult HistoryEngine::Redo() { return Step(Direction::kRedo); }

HistoryResult HistoryEngine::Step(Direction dir) {
  const bool undo = dir == Direction::kUndo;
  const char* what = undo ? "Undo" : "Redo";

  if (IsLocked()) {
    SKITCH_LOG_INFO("{} blocked: history {}", what, HistoryStateName(state_));
    return HistoryResult::kBusy;
  }
  if (undo ? undo_.size() <= 1 : redo_.empty()) {
    SKITCH_LOG_DEBUG("Nothing to {}", undo ? "undo" : "redo");
    return undo ? HistoryResult::kNothingToUndo
                : HistoryResult::kNothingToRedo;
  }

  // Pending edits land in history before the stacks move.  A new capture
  // here clears the redo stack, so redo is re-checked.
  surface_->ExitInteractiveEdit();
  if (state_ == HistoryState::kDebouncing) Capture();
  if (!undo && redo_.empty()) {
    SKITCH_LOG_DEBUG("Nothing to redo after pending edit");
    return HistoryResult::kNothingToRedo;
  }

  CancelDebounce();
  state_ = HistoryState::kRestoring;
  suppress_redo_clear_ = true;

  SnapshotId moved = 0;
  SnapshotId target = 0;
  if (undo) {
    moved = undo_.back();
    undo_.pop_back();
    redo_.push_back(moved);
    target = undo_.back();
  } else {
    moved = redo_.back();
    redo_.pop_back();
    undo_.push_back(moved);
    target = moved;
  }

  HistoryResult result = HistoryResult::kOk;
  Snapshot snapshot;
  if (!Resolve(target, &snapshot)) {
    SKITCH_LOG_ERROR("History data loss: snapshot {} is in neither cache "
                     "nor store; {} rolled back",
                     target, what);
    result = HistoryResult::kSnapshotMissing;
  } else if (!RestoreSurface(snapshot)) {
    SKITCH_LOG_ERROR("{} failed: document rejected snapshot {}; rolled back",
                     what, target);
    result = HistoryResult::kRestoreFailed;
  }

  if (result != HistoryResult::kOk) {
    if (undo) {
      redo_.pop_back();
      undo_.push_back(moved);
    } else {
      undo_.pop_back();
      redo_.push_back(moved);
    }
    suppress_redo_clear_ = false;
    state_ = HistoryState::kIdle;
    return result;
  }

  SKITCH_LOG_INFO("{} done. Undo: {}, Redo: {}", what, undo_.size(),
                  redo_.size());
  ScheduleSettle();
  return HistoryResult::kOk;
}

bool HistoryEngine::RestoreSurface(const Snapshot& snapshot) {
  try {
    return surface_->Restore(snapshot);
  } catch (const std::exception& e) {
    SKITCH_LOG_ERROR("Restore threw: {}", e.what());
    return false;
  }
}

void HistoryEngine::ScheduleSettle() {
  if (config_.settle_ms <= 0) {
    Settle();
    return;
  }
  settle_task_ = scheduler_->PostDelayed(
      std::chrono::milliseconds(config_.settle_ms), [this] {
        settle_task_ = 0;
        Settle();
      });
}

void HistoryEngine::Settle() {
  CancelDebounce();
  state_ = HistoryState::kIdle;
  suppress_redo_clear_ = false;
  SKITCH_LOG_TRACE("History settled");
}

// ---------------------------------------------------------------------------
// Clearing / replacement
// ---------------------------------------------------------------------------

HistoryResult HistoryEngine::ClearHistory() {
  if (state_ == HistoryState::kCapturing ||
      state_ == HistoryState::kRestoring) {
    SKITCH_LOG_INFO("Clear history blocked: history {}",
                    HistoryStateName(state_));
    return HistoryResult::kBusy;
  }
  CancelDebounce();
  ResetStacks();
  writer_->Clear();
  SKITCH_LOG_INFO("History cleared");
  return HistoryResult::kOk;
}

HistoryResult HistoryEngine::ReplaceDocument(const Mutator& mutator) {
  if (IsLocked()) {
    SKITCH_LOG_INFO("Document replacement blocked: history {}",
                    HistoryStateName(state_));
    return HistoryResult::kBusy;
  }
  CancelDebounce();
  state_ = HistoryState::kReplacing;

  bool ok = false;
  try {
    ok = mutator && mutator();
  } catch (const std::exception& e) {
    SKITCH_LOG_ERROR("Document replacement threw: {}", e.what());
  }
  if (!ok) {
    state_ = HistoryState::kIdle;
    SKITCH_LOG_WARN("Document replacement failed; history kept");
    return HistoryResult::kFailed;
  }

  ResetStacks();
  writer_->Clear();
  state_ = HistoryState::kIdle;
  suppress_redo_clear_ = false;
  SKITCH_LOG_INFO("Document replaced; history reset");
  return Capture();
}

void HistoryEngine::CollectGarbage() {
  std::unordered_set<SnapshotId> live(undo_.begin(), undo_.end());
  live.insert(redo_.begin(), redo_.end());
  writer_->DeleteAllExcept(std::move(live));
  captures_since_gc_ = 0;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

bool HistoryEngine::Resolve(SnapshotId id, Snapshot* out) {
  if (cache_->Get(id, out)) return true;
  if (!writer_->Get(id, out)) return false;
  cache_->Put(id, *out);
  SKITCH_LOG_DEBUG("Snapshot {} loaded from store", id);
  return true;
}

void HistoryEngine::Release(SnapshotId id) {
  cache_->Erase(id);
  writer_->Delete(id);
}

void HistoryEngine::ResetStacks() {
  undo_.clear();
  redo_.clear();
  next_id_ = 0;
  captures_since_gc_ = 0;
  cache_->Clear();
}

void HistoryEngine::CancelDebounce() {
  if (debounce_task_) {
    scheduler_->Cancel(debounce_task_);
    debounce_task_ = 0;
  }
  if (state_ == HistoryState::kDebouncing) state_ = HistoryState::kIdle;
}

}  // namespace internal
}  // namespace skitch
