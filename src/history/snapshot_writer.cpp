// Copyright 2026 The skitch Authors

#include "history/snapshot_writer.h"

#include <algorithm>
#include <exception>
#include <memory>
#include <utility>

#include "core/logger.h"

namespace skitch {
namespace internal {

SnapshotWriter::SnapshotWriter(std::unique_ptr<SnapshotStore> store,
                               size_t capacity, SkitchWritePolicy policy)
    : store_(std::move(store)),
      capacity_((std::max)(capacity, size_t{1})),
      policy_(policy) {
  if (store_) {
    worker_ = std::thread(&SnapshotWriter::WorkerLoop, this);
  } else {
    SKITCH_LOG_WARN("Snapshot writer has no store; history is memory-only");
  }
}

SnapshotWriter::~SnapshotWriter() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  work_cv_.notify_all();
  space_cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void SnapshotWriter::Put(SnapshotId id, const Snapshot& snapshot) {
  Op op;
  op.kind = Op::Kind::kPut;
  op.id = id;
  op.snapshot = snapshot;
  Enqueue(std::move(op));
}

void SnapshotWriter::Delete(SnapshotId id) {
  Op op;
  op.kind = Op::Kind::kDelete;
  op.id = id;
  Enqueue(std::move(op));
}

void SnapshotWriter::DeleteAllExcept(std::unordered_set<SnapshotId> live) {
  Op op;
  op.kind = Op::Kind::kDeleteAllExcept;
  op.live = std::move(live);
  Enqueue(std::move(op));
}

void SnapshotWriter::Clear() {
  Op op;
  op.kind = Op::Kind::kClear;
  Enqueue(std::move(op));
}

void SnapshotWriter::Enqueue(Op op) {
  if (!store_) return;

  std::unique_lock<std::mutex> lock(mutex_);
  if (stop_) return;

  // Coalesce against queued work.
  if (op.kind == Op::Kind::kClear) {
    queue_.clear();
    space_cv_.notify_all();
  } else if (op.kind == Op::Kind::kDelete) {
    SnapshotId id = op.id;
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                [id](const Op& q) {
                                  return q.kind == Op::Kind::kPut &&
                                         q.id == id;
                                }),
                 queue_.end());
  }

  if (queue_.size() >= capacity_) {
    // Drop the oldest Put, else the oldest delete; a pending Clear is never
    // dropped.  A later garbage collection removes what a dropped delete
    // left behind.
    auto victim = queue_.end();
    if (policy_ == kSkitchWritePolicyDropOldest) {
      victim = std::find_if(queue_.begin(), queue_.end(), [](const Op& q) {
        return q.kind == Op::Kind::kPut;
      });
      if (victim == queue_.end()) {
        victim = std::find_if(queue_.begin(), queue_.end(), [](const Op& q) {
          return q.kind != Op::Kind::kClear;
        });
      }
    }
    if (victim != queue_.end()) {
      ++dropped_;
      SKITCH_LOG_WARN("Snapshot write queue full ({}); dropping pending op "
                      "(kind {}, id {})",
                      capacity_, static_cast<int>(victim->kind), victim->id);
      queue_.erase(victim);
    } else {
      SKITCH_LOG_DEBUG("Snapshot write queue full ({}); waiting", capacity_);
      space_cv_.wait(lock,
                     [this] { return stop_ || queue_.size() < capacity_; });
      if (stop_) return;
    }
  }

  queue_.push_back(std::move(op));
  work_cv_.notify_one();
}

SnapshotWriter::Match SnapshotWriter::MatchOp(const Op& op, SnapshotId id,
                                              Snapshot* out) {
  switch (op.kind) {
    case Op::Kind::kPut:
      if (op.id != id) return Match::kNone;
      if (out) *out = op.snapshot;
      return Match::kFound;
    case Op::Kind::kDelete:
      return op.id == id ? Match::kHidden : Match::kNone;
    case Op::Kind::kDeleteAllExcept:
      return op.live.count(id) ? Match::kNone : Match::kHidden;
    case Op::Kind::kClear:
      return Match::kHidden;
  }
  return Match::kNone;
}

bool SnapshotWriter::Get(SnapshotId id, Snapshot* out) {
  if (!store_) return false;

  // Holding store_mutex_ keeps the worker from applying anything, so the
  // queue plus the in-flight op are exactly the unapplied mutations.
  std::lock_guard<std::mutex> store_lock(store_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = queue_.rbegin(); it != queue_.rend(); ++it) {
      Match m = MatchOp(*it, id, out);
      if (m == Match::kFound) return true;
      if (m == Match::kHidden) return false;
    }
    if (in_flight_) {
      Match m = MatchOp(*in_flight_, id, out);
      if (m == Match::kFound) return true;
      if (m == Match::kHidden) return false;
    }
  }
  return store_->Get(id, out);
}

void SnapshotWriter::Flush() {
  if (!store_) return;
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] {
    return (queue_.empty() && !in_flight_) || !worker_.joinable();
  });
}

size_t SnapshotWriter::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size() + (in_flight_ ? 1 : 0);
}

uint64_t SnapshotWriter::dropped_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

uint64_t SnapshotWriter::failed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_;
}

void SnapshotWriter::Apply(const Op& op) {
  bool ok = false;
  try {
    switch (op.kind) {
      case Op::Kind::kPut:
        ok = store_->Put(op.id, op.snapshot);
        break;
      case Op::Kind::kDelete:
        ok = store_->Delete(op.id);
        break;
      case Op::Kind::kDeleteAllExcept:
        ok = store_->DeleteAllExcept(op.live);
        break;
      case Op::Kind::kClear:
        ok = store_->Clear();
        break;
    }
  } catch (const std::exception& e) {
    SKITCH_LOG_ERROR("Snapshot store op threw (kind {}, id {}): {}",
                     static_cast<int>(op.kind), op.id, e.what());
    ok = false;
  }
  if (!ok) {
    SKITCH_LOG_ERROR("Snapshot store op failed (kind {}, id {})",
                     static_cast<int>(op.kind), op.id);
    std::lock_guard<std::mutex> lock(mutex_);
    ++failed_;
  }
}

void SnapshotWriter::WorkerLoop() {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
      if (queue_.empty()) {
        // stop_ with nothing left to drain.
        break;
      }
      in_flight_ = std::make_unique<Op>(std::move(queue_.front()));
      queue_.pop_front();
    }
    space_cv_.notify_one();

    {
      std::lock_guard<std::mutex> store_lock(store_mutex_);
      Apply(*in_flight_);
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_.reset();
    }
    idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
}

}  // namespace internal
}  // namespace skitch
