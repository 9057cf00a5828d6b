// Copyright 2026 The skitch Authors

#ifndef SKITCH_HISTORY_FILE_SNAPSHOT_STORE_H_
#define SKITCH_HISTORY_FILE_SNAPSHOT_STORE_H_

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "history/snapshot_store.h"

namespace skitch {
namespace internal {

/// Snapshot store keeping one `<id>.snap` file per snapshot in a directory.
///
/// Writes land in `<id>.snap.tmp` and are renamed into place, so a reader
/// (or a later session) never sees a partially written snapshot.
/// Thread-compatible: the snapshot writer serializes all access.
class FileSnapshotStore : public SnapshotStore {
 public:
  /// Create `dir` if needed.  Returns nullptr if it is not usable.
  static std::unique_ptr<FileSnapshotStore> Open(const std::string& dir);

  /// Does not touch the filesystem; use Open() to validate `dir`.
  explicit FileSnapshotStore(std::string dir);

  bool Put(SnapshotId id, const Snapshot& snapshot) override;
  bool Get(SnapshotId id, Snapshot* out) override;
  bool Delete(SnapshotId id) override;
  bool DeleteAllExcept(const std::unordered_set<SnapshotId>& live) override;
  bool Clear() override;
  bool ListIds(std::vector<SnapshotId>* out) override;

  const std::string& dir() const { return dir_; }

 private:
  std::string PathFor(SnapshotId id) const;

  std::string dir_;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_HISTORY_FILE_SNAPSHOT_STORE_H_
