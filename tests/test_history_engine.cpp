// Copyright 2026 The skitch Authors
// Tests for: HistoryEngine (debounced capture, de-duplication, undo/redo,
//            settle lock, trimming, clearing, replacement, degraded mode)

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "core/task_scheduler.h"
#include "history/history_engine.h"
#include "history/snapshot_cache.h"
#include "history/snapshot_writer.h"
#include "test_util.h"

using skitch::internal::ChangeKind;
using skitch::internal::ChangeListener;
using skitch::internal::DocumentSurface;
using skitch::internal::HistoryConfig;
using skitch::internal::HistoryEngine;
using skitch::internal::HistoryResult;
using skitch::internal::HistoryState;
using skitch::internal::ManualClock;
using skitch::internal::Snapshot;
using skitch::internal::SnapshotCache;
using skitch::internal::SnapshotId;
using skitch::internal::SnapshotWriter;
using skitch::internal::TaskScheduler;
using skitch_test::MakeSnapshot;
using skitch_test::MemorySnapshotStore;
using skitch_test::SnapshotText;
using skitch_test::StoreHas;
using std::chrono::milliseconds;

namespace {

/// Document whose whole state is a string.
class FakeSurface : public DocumentSurface {
 public:
  bool Serialize(Snapshot* out) const override {
    if (throw_on_serialize) throw std::runtime_error("serialize boom");
    *out = MakeSnapshot(state);
    return true;
  }

  bool Restore(const Snapshot& snapshot) override {
    ++restores;
    if (fail_restore) return false;
    if (throw_on_restore) throw std::runtime_error("restore boom");
    state = SnapshotText(snapshot);
    Emit(ChangeKind::kRestored);
    return true;
  }

  void AddChangeListener(ChangeListener* l) override { listeners.push_back(l); }
  void RemoveChangeListener(ChangeListener* l) override {
    listeners.erase(std::remove(listeners.begin(), listeners.end(), l),
                    listeners.end());
  }

  void ExitInteractiveEdit() override {
    if (!editing) return;
    editing = false;
    Emit(ChangeKind::kTextEditExited);
  }

  void Mutate(const std::string& s,
              ChangeKind kind = ChangeKind::kObjectModified) {
    state = s;
    Emit(kind);
  }

  void Emit(ChangeKind kind) {
    for (auto* l : listeners) l->OnDocumentChanged(kind);
  }

  std::string state = "initial";
  bool editing = false;
  bool fail_restore = false;
  bool throw_on_serialize = false;
  bool throw_on_restore = false;
  int restores = 0;
  std::vector<ChangeListener*> listeners;
};

}  // namespace

class HistoryEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.max_undo_steps = 100;
    config_.cache_capacity = 20;
    config_.debounce_ms = 150;
    config_.settle_ms = 500;
    config_.gc_interval = 0;
  }

  void Build(bool with_store = true) {
    std::unique_ptr<MemorySnapshotStore> store;
    if (with_store) store = std::make_unique<MemorySnapshotStore>(&shared_);
    cache_ = std::make_unique<SnapshotCache>(config_.cache_capacity);
    writer_ = std::make_unique<SnapshotWriter>(std::move(store), 64,
                                               kSkitchWritePolicyBlock);
    engine_ = std::make_unique<HistoryEngine>(&surface_, cache_.get(),
                                              writer_.get(), &scheduler_,
                                              config_);
    ASSERT_EQ(engine_->Start(), HistoryResult::kOk);
  }

  void Advance(int ms) {
    clock_.Advance(milliseconds(ms));
    scheduler_.RunDue();
  }

  // Change the document and capture right away.
  void Commit(const std::string& s) {
    surface_.Mutate(s);
    ASSERT_EQ(engine_->Flush(), HistoryResult::kOk) << s;
  }

  void Settle() { Advance(config_.settle_ms); }

  HistoryConfig config_;
  ManualClock clock_;
  TaskScheduler scheduler_{&clock_};
  MemorySnapshotStore::Shared shared_;
  FakeSurface surface_;
  std::unique_ptr<SnapshotCache> cache_;
  std::unique_ptr<SnapshotWriter> writer_;
  std::unique_ptr<HistoryEngine> engine_;
};

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------

TEST_F(HistoryEngineTest, StartRecordsInitialSnapshot) {
  Build();
  EXPECT_EQ(engine_->undo_depth(), 1);
  EXPECT_EQ(engine_->redo_depth(), 0);
  EXPECT_EQ(engine_->top_id(), 1);
  EXPECT_FALSE(engine_->CanUndo());
  EXPECT_FALSE(engine_->degraded());
  writer_->Flush();
  EXPECT_TRUE(StoreHas(&shared_, 1));
}

TEST_F(HistoryEngineTest, StartWipesPreviousSession) {
  shared_.blobs[77] = MakeSnapshot("stale");
  Build();
  writer_->Flush();
  EXPECT_FALSE(StoreHas(&shared_, 77));
  EXPECT_TRUE(StoreHas(&shared_, 1));
}

// ---------------------------------------------------------------------------
// Debounced capture
// ---------------------------------------------------------------------------

TEST_F(HistoryEngineTest, CaptureWaitsForDebounce) {
  Build();
  surface_.Mutate("a");
  EXPECT_EQ(engine_->state(), HistoryState::kDebouncing);
  Advance(149);
  EXPECT_EQ(engine_->undo_depth(), 1);
  Advance(1);
  EXPECT_EQ(engine_->undo_depth(), 2);
  EXPECT_EQ(engine_->state(), HistoryState::kIdle);
}

TEST_F(HistoryEngineTest, EachChangeRestartsDebounce) {
  Build();
  surface_.Mutate("a");
  Advance(100);
  surface_.Mutate("ab");
  Advance(100);
  EXPECT_EQ(engine_->undo_depth(), 1);
  Advance(50);
  EXPECT_EQ(engine_->undo_depth(), 2);
}

TEST_F(HistoryEngineTest, IdenticalMutationsWithinWindowPushOnce) {
  Build();
  surface_.Mutate("same");
  surface_.Mutate("same");
  Advance(150);
  EXPECT_EQ(engine_->undo_depth(), 2);
  surface_.Mutate("same");
  Advance(150);
  EXPECT_EQ(engine_->undo_depth(), 2);
}

TEST_F(HistoryEngineTest, CaptureEqualToTopIsUnchanged) {
  Build();
  EXPECT_EQ(engine_->Flush(), HistoryResult::kUnchanged);
  surface_.Mutate("x");
  surface_.Mutate("initial");
  Advance(150);
  EXPECT_EQ(engine_->undo_depth(), 1);
}

TEST_F(HistoryEngineTest, DistinctCapturesMinusConsecutiveDuplicates) {
  Build();
  const char* states[] = {"a", "b", "b", "c", "a", "a", "d"};
  for (const char* s : states) {
    surface_.Mutate(s);
    engine_->Flush();
  }
  // initial, a, b, c, a, d
  EXPECT_EQ(engine_->undo_depth(), 6);
}

TEST_F(HistoryEngineTest, TextEditExitCapturesImmediately) {
  Build();
  surface_.editing = true;
  surface_.Mutate("typing", ChangeKind::kTextChanged);
  EXPECT_EQ(engine_->state(), HistoryState::kDebouncing);
  surface_.ExitInteractiveEdit();
  EXPECT_EQ(engine_->undo_depth(), 2);
  EXPECT_EQ(engine_->state(), HistoryState::kIdle);
  EXPECT_EQ(scheduler_.pending_count(), 0u);
}

TEST_F(HistoryEngineTest, CaptureCallbackReceivesId) {
  Build();
  std::vector<SnapshotId> ids;
  engine_->set_capture_callback([&](SnapshotId id) { ids.push_back(id); });
  Commit("a");
  Commit("b");
  EXPECT_EQ(ids, (std::vector<SnapshotId>{2, 3}));
}

TEST_F(HistoryEngineTest, SerializeExceptionAbortsCapture) {
  Build();
  surface_.throw_on_serialize = true;
  surface_.state = "a";
  EXPECT_EQ(engine_->Capture(), HistoryResult::kFailed);
  EXPECT_EQ(engine_->state(), HistoryState::kIdle);
  EXPECT_EQ(engine_->undo_depth(), 1);
}

// ---------------------------------------------------------------------------
// Undo / redo
// ---------------------------------------------------------------------------

TEST_F(HistoryEngineTest, UndoAtDepthOneIsNoop) {
  Build();
  EXPECT_EQ(engine_->Undo(), HistoryResult::kNothingToUndo);
  EXPECT_EQ(surface_.restores, 0);
  EXPECT_EQ(engine_->undo_depth(), 1);
}

TEST_F(HistoryEngineTest, RedoWithEmptyStackIsNoop) {
  Build();
  Commit("a");
  EXPECT_EQ(engine_->Redo(), HistoryResult::kNothingToRedo);
}

TEST_F(HistoryEngineTest, UndoThenRedoRestoresIdenticalDocument) {
  Build();
  Commit("a");
  Commit("b");
  Snapshot before;
  ASSERT_TRUE(surface_.Serialize(&before));

  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  EXPECT_EQ(surface_.state, "a");
  Settle();
  ASSERT_EQ(engine_->Redo(), HistoryResult::kOk);
  Snapshot after;
  ASSERT_TRUE(surface_.Serialize(&after));
  EXPECT_EQ(before, after);
}

TEST_F(HistoryEngineTest, UndoMovesTopToRedo) {
  Build();
  Commit("a");  // id 2
  Commit("b");  // id 3
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  EXPECT_EQ(engine_->undo_stack(), (std::vector<SnapshotId>{1, 2}));
  EXPECT_EQ(engine_->redo_stack(), (std::vector<SnapshotId>{3}));
}

TEST_F(HistoryEngineTest, NewCaptureClearsRedo) {
  Build();
  Commit("A");
  Commit("B");
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  EXPECT_EQ(engine_->redo_depth(), 1);
  Settle();
  Commit("C");
  EXPECT_EQ(engine_->redo_depth(), 0);
  EXPECT_FALSE(engine_->CanRedo());
}

TEST_F(HistoryEngineTest, LockedUntilSettleDelay) {
  Build();
  Commit("a");
  Commit("b");
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  EXPECT_TRUE(engine_->IsLocked());
  EXPECT_TRUE(engine_->redo_clear_suppressed());
  EXPECT_EQ(engine_->Undo(), HistoryResult::kBusy);
  EXPECT_EQ(engine_->Redo(), HistoryResult::kBusy);
  EXPECT_EQ(engine_->Flush(), HistoryResult::kBusy);
  Advance(499);
  EXPECT_TRUE(engine_->IsLocked());
  Advance(1);
  EXPECT_FALSE(engine_->IsLocked());
  EXPECT_FALSE(engine_->redo_clear_suppressed());
  EXPECT_EQ(engine_->Undo(), HistoryResult::kOk);
}

TEST_F(HistoryEngineTest, ChangesDuringSettleAreNotCaptured) {
  Build();
  Commit("a");
  Commit("b");
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  surface_.Emit(ChangeKind::kObjectModified);
  Settle();
  Advance(1000);
  EXPECT_EQ(engine_->undo_depth(), 2);
  EXPECT_EQ(engine_->redo_depth(), 1);
}

TEST_F(HistoryEngineTest, ZeroSettleUnlocksImmediately) {
  config_.settle_ms = 0;
  Build();
  Commit("a");
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  EXPECT_FALSE(engine_->IsLocked());
  EXPECT_EQ(engine_->Redo(), HistoryResult::kOk);
  EXPECT_EQ(surface_.state, "a");
}

TEST_F(HistoryEngineTest, UndoCapturesPendingEditFirst) {
  Build();
  Commit("a");
  surface_.Mutate("a+pending");
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  EXPECT_EQ(surface_.state, "a");
  EXPECT_EQ(engine_->redo_depth(), 1);
  Settle();
  ASSERT_EQ(engine_->Redo(), HistoryResult::kOk);
  EXPECT_EQ(surface_.state, "a+pending");
}

TEST_F(HistoryEngineTest, UndoLeavesTextEditAndCapturesIt) {
  Build();
  Commit("a");
  surface_.editing = true;
  surface_.Mutate("a typed", ChangeKind::kTextChanged);
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  EXPECT_FALSE(surface_.editing);
  EXPECT_EQ(surface_.state, "a");
  EXPECT_EQ(engine_->redo_depth(), 1);
}

TEST_F(HistoryEngineTest, RedoInvalidatedByPendingEdit) {
  Build();
  Commit("a");
  Commit("b");
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  Settle();
  surface_.Mutate("fork");
  EXPECT_EQ(engine_->Redo(), HistoryResult::kNothingToRedo);
  EXPECT_EQ(surface_.state, "fork");
  EXPECT_EQ(engine_->undo_depth(), 3);
}

TEST_F(HistoryEngineTest, UndoReadsEvictedSnapshotFromStore) {
  config_.cache_capacity = 2;
  Build();
  for (int i = 0; i < 5; ++i) Commit("s" + std::to_string(i));
  EXPECT_FALSE(cache_->Has(1));
  for (int i = 0; i < 5; ++i) {
    ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
    Settle();
  }
  EXPECT_EQ(surface_.state, "initial");
  EXPECT_TRUE(cache_->Has(1));
}

TEST_F(HistoryEngineTest, MissingSnapshotRollsBack) {
  config_.cache_capacity = 1;
  Build();
  writer_->Flush();
  {
    std::lock_guard<std::mutex> lock(shared_.mu);
    shared_.fail = true;
  }
  Commit("a");
  Commit("b");
  writer_->Flush();  // Puts failed; only the cache holds "b".

  EXPECT_EQ(engine_->Undo(), HistoryResult::kSnapshotMissing);
  EXPECT_EQ(engine_->undo_stack(), (std::vector<SnapshotId>{1, 2, 3}));
  EXPECT_TRUE(engine_->redo_stack().empty());
  EXPECT_EQ(engine_->state(), HistoryState::kIdle);
  EXPECT_FALSE(engine_->redo_clear_suppressed());
  EXPECT_EQ(surface_.state, "b");
}

TEST_F(HistoryEngineTest, RejectedRestoreRollsBack) {
  Build();
  Commit("a");
  Commit("b");
  surface_.fail_restore = true;
  EXPECT_EQ(engine_->Redo(), HistoryResult::kNothingToRedo);
  EXPECT_EQ(engine_->Undo(), HistoryResult::kRestoreFailed);
  EXPECT_EQ(engine_->undo_depth(), 3);
  EXPECT_EQ(engine_->redo_depth(), 0);
  EXPECT_FALSE(engine_->IsLocked());
  EXPECT_EQ(surface_.state, "b");
}

TEST_F(HistoryEngineTest, ThrowingRestoreRollsBack) {
  Build();
  Commit("a");
  Commit("b");
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  Settle();
  ASSERT_FALSE(engine_->IsLocked());
  EXPECT_EQ(surface_.state, "a");

  surface_.throw_on_restore = true;
  EXPECT_EQ(engine_->Undo(), HistoryResult::kRestoreFailed);
  EXPECT_EQ(engine_->undo_depth(), 2);
  EXPECT_EQ(engine_->redo_depth(), 1);
  EXPECT_EQ(engine_->state(), HistoryState::kIdle);
  EXPECT_EQ(surface_.state, "a");

  EXPECT_EQ(engine_->Redo(), HistoryResult::kRestoreFailed);
  EXPECT_EQ(engine_->undo_depth(), 2);
  EXPECT_EQ(engine_->redo_depth(), 1);

  surface_.throw_on_restore = false;
  EXPECT_EQ(engine_->Redo(), HistoryResult::kOk);
  EXPECT_EQ(surface_.state, "b");
}

// ---------------------------------------------------------------------------
// Trimming and garbage collection
// ---------------------------------------------------------------------------

TEST_F(HistoryEngineTest, DepthCappedAtMaxUndoSteps) {
  Build();
  for (int i = 0; i < 100; ++i) Commit("state " + std::to_string(i));
  // 101 distinct captures including the initial one.
  EXPECT_EQ(engine_->undo_depth(), 100);
  EXPECT_EQ(engine_->undo_stack().front(), 2);
  EXPECT_FALSE(cache_->Has(1));
  writer_->Flush();
  EXPECT_FALSE(StoreHas(&shared_, 1));
  EXPECT_TRUE(StoreHas(&shared_, 2));
}

TEST_F(HistoryEngineTest, ClearedRedoEntriesLeaveStore) {
  config_.settle_ms = 0;
  Build();
  Commit("a");  // 2
  Commit("b");  // 3
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  Commit("c");  // 4 clears redo [3]
  writer_->Flush();
  EXPECT_FALSE(StoreHas(&shared_, 3));
  EXPECT_TRUE(StoreHas(&shared_, 4));
}

TEST_F(HistoryEngineTest, PeriodicGarbageCollection) {
  config_.gc_interval = 2;
  Build();
  writer_->Flush();
  {
    std::lock_guard<std::mutex> lock(shared_.mu);
    shared_.blobs[500] = MakeSnapshot("orphan");
  }
  Commit("a");
  Commit("b");
  writer_->Flush();
  EXPECT_FALSE(StoreHas(&shared_, 500));
  EXPECT_TRUE(StoreHas(&shared_, 3));
}

// ---------------------------------------------------------------------------
// Clear / replace
// ---------------------------------------------------------------------------

TEST_F(HistoryEngineTest, ClearHistoryThenCaptureRestartsIds) {
  Build();
  Commit("a");
  Commit("b");
  ASSERT_EQ(engine_->ClearHistory(), HistoryResult::kOk);
  EXPECT_EQ(engine_->undo_depth(), 0);
  EXPECT_EQ(cache_->size(), 0u);
  ASSERT_EQ(engine_->Capture(), HistoryResult::kOk);
  EXPECT_EQ(engine_->undo_stack(), (std::vector<SnapshotId>{1}));

  writer_->Flush();
  std::lock_guard<std::mutex> lock(shared_.mu);
  ASSERT_EQ(shared_.blobs.size(), 1u);
  EXPECT_EQ(SnapshotText(shared_.blobs[1]), "b");
}

TEST_F(HistoryEngineTest, ClearHistoryRefusedWhileRestoring) {
  Build();
  Commit("a");
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  EXPECT_EQ(engine_->ClearHistory(), HistoryResult::kBusy);
  EXPECT_EQ(engine_->redo_depth(), 1);
}

TEST_F(HistoryEngineTest, ClearHistoryCancelsPendingCapture) {
  Build();
  surface_.Mutate("a");
  ASSERT_EQ(engine_->ClearHistory(), HistoryResult::kOk);
  Advance(1000);
  EXPECT_EQ(engine_->undo_depth(), 0);
}

TEST_F(HistoryEngineTest, ReplaceDocumentResetsHistory) {
  Build();
  Commit("a");
  Commit("b");
  HistoryResult r = engine_->ReplaceDocument([this] {
    EXPECT_EQ(engine_->state(), HistoryState::kReplacing);
    surface_.Mutate("replaced", ChangeKind::kReplaced);
    return true;
  });
  ASSERT_EQ(r, HistoryResult::kOk);
  EXPECT_EQ(engine_->undo_stack(), (std::vector<SnapshotId>{1}));
  EXPECT_EQ(engine_->redo_depth(), 0);
  EXPECT_EQ(engine_->state(), HistoryState::kIdle);
  EXPECT_EQ(scheduler_.pending_count(), 0u);
  EXPECT_FALSE(engine_->CanUndo());

  writer_->Flush();
  std::lock_guard<std::mutex> lock(shared_.mu);
  ASSERT_EQ(shared_.blobs.size(), 1u);
  EXPECT_EQ(SnapshotText(shared_.blobs[1]), "replaced");
}

TEST_F(HistoryEngineTest, FailedReplacementKeepsHistory) {
  Build();
  Commit("a");
  EXPECT_EQ(engine_->ReplaceDocument([] { return false; }),
            HistoryResult::kFailed);
  EXPECT_EQ(engine_->undo_depth(), 2);
  EXPECT_EQ(engine_->ReplaceDocument([]() -> bool {
              throw std::runtime_error("replace boom");
            }),
            HistoryResult::kFailed);
  EXPECT_EQ(engine_->undo_depth(), 2);
  EXPECT_EQ(engine_->state(), HistoryState::kIdle);
}

TEST_F(HistoryEngineTest, ReplaceRefusedWhileRestoring) {
  Build();
  Commit("a");
  ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  bool ran = false;
  EXPECT_EQ(engine_->ReplaceDocument([&] {
              ran = true;
              return true;
            }),
            HistoryResult::kBusy);
  EXPECT_FALSE(ran);
}

// ---------------------------------------------------------------------------
// Degraded (cache-only) mode
// ---------------------------------------------------------------------------

TEST_F(HistoryEngineTest, WorksWithoutStore) {
  config_.cache_capacity = 2;
  config_.max_undo_steps = 10;
  config_.settle_ms = 0;
  Build(/*with_store=*/false);
  EXPECT_TRUE(engine_->degraded());
  EXPECT_GE(cache_->capacity(), 20u);

  for (int i = 0; i < 5; ++i) Commit("s" + std::to_string(i));
  for (int i = 0; i < 5; ++i) {
    ASSERT_EQ(engine_->Undo(), HistoryResult::kOk);
  }
  EXPECT_EQ(surface_.state, "initial");
  for (int i = 0; i < 5; ++i) {
    ASSERT_EQ(engine_->Redo(), HistoryResult::kOk);
  }
  EXPECT_EQ(surface_.state, "s4");
}

TEST(HistoryStateNameTest, Names) {
  EXPECT_STREQ(skitch::internal::HistoryStateName(HistoryState::kIdle),
               "idle");
  EXPECT_STREQ(skitch::internal::HistoryStateName(HistoryState::kRestoring),
               "restoring");
}
