// Copyright 2026 The skitch Authors

#ifndef SKITCH_HISTORY_SNAPSHOT_WRITER_H_
#define SKITCH_HISTORY_SNAPSHOT_WRITER_H_

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>

#include "history/snapshot.h"
#include "history/snapshot_store.h"
#include "skitch/skitch.h"

namespace skitch {
namespace internal {

/// Write-behind queue in front of a SnapshotStore.
///
/// Mutations are queued and applied in order by a single worker thread.
/// Get() observes queued mutations (read-your-writes): a queued Put is
/// returned directly, a queued Delete or Clear hides the persisted copy.
///
/// When constructed without a store the writer is a sink: mutations are
/// discarded and Get() always misses.
///
/// A full queue either blocks the producer (kSkitchWritePolicyBlock) or
/// discards its oldest pending Put, or its oldest op when none is a Put
/// (kSkitchWritePolicyDropOldest).
class SnapshotWriter {
 public:
  SnapshotWriter(std::unique_ptr<SnapshotStore> store, size_t capacity,
                 SkitchWritePolicy policy);

  /// Drains the queue, then stops the worker.
  ~SnapshotWriter();

  SnapshotWriter(const SnapshotWriter&) = delete;
  SnapshotWriter& operator=(const SnapshotWriter&) = delete;

  bool has_store() const { return store_ != nullptr; }

  void Put(SnapshotId id, const Snapshot& snapshot);
  void Delete(SnapshotId id);
  void DeleteAllExcept(std::unordered_set<SnapshotId> live);
  void Clear();

  /// Blocking read through the queue to the store.
  bool Get(SnapshotId id, Snapshot* out);

  /// Wait until every queued operation has been applied.
  void Flush();

  size_t pending() const;
  uint64_t dropped_count() const;
  uint64_t failed_count() const;

 private:
  struct Op {
    enum class Kind { kPut, kDelete, kDeleteAllExcept, kClear };
    Kind kind;
    SnapshotId id = 0;
    Snapshot snapshot;
    std::unordered_set<SnapshotId> live;
  };

  // Result of matching `id` against one queued op.
  enum class Match { kNone, kFound, kHidden };
  static Match MatchOp(const Op& op, SnapshotId id, Snapshot* out);

  void Enqueue(Op op);
  void Apply(const Op& op);
  void WorkerLoop();

  std::unique_ptr<SnapshotStore> store_;
  const size_t capacity_;
  const SkitchWritePolicy policy_;

  // Lock order: store_mutex_ before mutex_.
  std::mutex store_mutex_;
  mutable std::mutex mutex_;
  std::condition_variable work_cv_;   // Worker waits for ops.
  std::condition_variable space_cv_;  // Producers wait for room.
  std::condition_variable idle_cv_;   // Flush waits for drain.
  std::deque<Op> queue_;
  std::unique_ptr<Op> in_flight_;
  bool stop_ = false;
  uint64_t dropped_ = 0;
  uint64_t failed_ = 0;

  std::thread worker_;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_HISTORY_SNAPSHOT_WRITER_H_
