// Copyright 2026 The skitch Authors

#include "history/snapshot_cache.h"

#include <algorithm>

#include "core/logger.h"

namespace skitch {
namespace internal {

SnapshotCache::SnapshotCache(size_t capacity)
    : capacity_((std::max)(capacity, size_t{1})) {}

bool SnapshotCache::Get(SnapshotId id, Snapshot* out) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) return false;
  if (out) *out = it->second;
  return true;
}

void SnapshotCache::Put(SnapshotId id, const Snapshot& snapshot) {
  auto it = entries_.find(id);
  if (it != entries_.end()) {
    it->second = snapshot;
    return;
  }
  entries_.emplace(id, snapshot);
  order_.push_back(id);
  EvictExcess();
}

bool SnapshotCache::Erase(SnapshotId id) {
  if (entries_.erase(id) == 0) return false;
  auto it = std::find(order_.begin(), order_.end(), id);
  if (it != order_.end()) order_.erase(it);
  return true;
}

void SnapshotCache::Clear() {
  entries_.clear();
  order_.clear();
}

void SnapshotCache::set_capacity(size_t capacity) {
  capacity_ = (std::max)(capacity, size_t{1});
  EvictExcess();
}

void SnapshotCache::EvictExcess() {
  while (order_.size() > capacity_) {
    SnapshotId oldest = order_.front();
    order_.pop_front();
    entries_.erase(oldest);
    SKITCH_LOG_TRACE("Snapshot cache evicted id {}", oldest);
  }
}

}  // namespace internal
}  // namespace skitch
