// Copyright 2026 The skitch Authors

#ifndef SKITCH_HISTORY_SNAPSHOT_H_
#define SKITCH_HISTORY_SNAPSHOT_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace skitch {
namespace internal {

/// Identifies a snapshot.  Assigned from 1 upwards by the history engine.
using SnapshotId = int64_t;

/// Immutable serialized document state.  Copies share the same bytes.
class Snapshot {
 public:
  Snapshot() = default;
  explicit Snapshot(std::vector<uint8_t> bytes);

  const uint8_t* data() const;
  size_t size() const { return bytes_ ? bytes_->size() : 0; }
  bool empty() const { return size() == 0; }

  const std::vector<uint8_t>& bytes() const;

  /// Content equality (byte-wise).
  bool operator==(const Snapshot& other) const;
  bool operator!=(const Snapshot& other) const { return !(*this == other); }

 private:
  std::shared_ptr<const std::vector<uint8_t>> bytes_;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_HISTORY_SNAPSHOT_H_
