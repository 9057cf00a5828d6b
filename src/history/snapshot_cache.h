// Copyright 2026 The skitch Authors

#ifndef SKITCH_HISTORY_SNAPSHOT_CACHE_H_
#define SKITCH_HISTORY_SNAPSHOT_CACHE_H_

#include <cstddef>
#include <deque>
#include <unordered_map>

#include "history/snapshot.h"

namespace skitch {
namespace internal {

/// Bounded in-memory snapshot map with insertion-order eviction.
///
/// Re-putting an existing id replaces its blob but keeps its original
/// position in the eviction order.  Not thread-safe; owned by the history
/// engine's thread.
class SnapshotCache {
 public:
  explicit SnapshotCache(size_t capacity = 20);

  bool Get(SnapshotId id, Snapshot* out) const;
  void Put(SnapshotId id, const Snapshot& snapshot);
  bool Has(SnapshotId id) const { return entries_.count(id) != 0; }
  bool Erase(SnapshotId id);
  void Clear();

  size_t size() const { return entries_.size(); }
  size_t capacity() const { return capacity_; }

  /// Shrinking evicts the oldest entries immediately.  Minimum 1.
  void set_capacity(size_t capacity);

 private:
  void EvictExcess();

  size_t capacity_;
  std::unordered_map<SnapshotId, Snapshot> entries_;
  std::deque<SnapshotId> order_;  // Oldest insertion first.
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_HISTORY_SNAPSHOT_CACHE_H_
