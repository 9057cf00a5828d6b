// Copyright 2026 The skitch Authors

#ifndef SKITCH_HISTORY_SNAPSHOT_STORE_H_
#define SKITCH_HISTORY_SNAPSHOT_STORE_H_

#include <unordered_set>
#include <vector>

#include "history/snapshot.h"

namespace skitch {
namespace internal {

/// Durable id -> blob storage.  Implementations log their own I/O errors
/// and report them through the return value.
class SnapshotStore {
 public:
  virtual ~SnapshotStore() = default;

  SnapshotStore(const SnapshotStore&) = delete;
  SnapshotStore& operator=(const SnapshotStore&) = delete;

  /// Insert or overwrite.
  virtual bool Put(SnapshotId id, const Snapshot& snapshot) = 0;

  /// Returns false on a miss or a read error.
  virtual bool Get(SnapshotId id, Snapshot* out) = 0;

  /// Deleting a missing id succeeds.
  virtual bool Delete(SnapshotId id) = 0;

  /// Remove every snapshot whose id is not in `live`.
  virtual bool DeleteAllExcept(const std::unordered_set<SnapshotId>& live) = 0;

  virtual bool Clear() = 0;

  virtual bool ListIds(std::vector<SnapshotId>* out) = 0;

 protected:
  SnapshotStore() = default;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_HISTORY_SNAPSHOT_STORE_H_
