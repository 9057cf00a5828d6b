// Copyright 2026 The skitch Authors
//
// Single-thread cooperative timer queue.  Tasks run only from RunDue(), on
// the thread that pumps it.

#ifndef SKITCH_CORE_TASK_SCHEDULER_H_
#define SKITCH_CORE_TASK_SCHEDULER_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

namespace skitch {
namespace internal {

/// Time source for the scheduler.  Tests inject a manual clock.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual std::chrono::steady_clock::time_point Now() const = 0;
};

/// Wall clock backed by std::chrono::steady_clock.
class SteadyClock : public Clock {
 public:
  std::chrono::steady_clock::time_point Now() const override {
    return std::chrono::steady_clock::now();
  }
};

/// Clock advanced explicitly by the caller.
class ManualClock : public Clock {
 public:
  std::chrono::steady_clock::time_point Now() const override { return now_; }
  void Advance(std::chrono::milliseconds delta) { now_ += delta; }

 private:
  std::chrono::steady_clock::time_point now_{};
};

class TaskScheduler {
 public:
  using TaskId = uint64_t;
  using Task = std::function<void()>;

  /// `clock` must outlive the scheduler; nullptr uses an internal
  /// SteadyClock.
  explicit TaskScheduler(const Clock* clock = nullptr);

  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;

  /// Run `task` once `delay` has elapsed.  Returns a non-zero id.
  TaskId PostDelayed(std::chrono::milliseconds delay, Task task);

  /// Cancel a pending task.  Returns false if it already ran or never
  /// existed.  Safe to call from inside a running task.
  bool Cancel(TaskId id);

  bool IsPending(TaskId id) const;

  /// Run every task whose deadline has passed, in deadline order.  Tasks
  /// posted while running are only picked up if already due.
  /// Returns the number of tasks executed.
  int RunDue();

  /// Earliest pending deadline.  Returns false if nothing is pending.
  bool NextDeadline(std::chrono::steady_clock::time_point* out) const;

  size_t pending_count() const { return tasks_.size(); }
  const Clock* clock() const { return clock_; }

 private:
  // Keyed by (deadline, id) so equal deadlines run in posting order.
  using Key = std::pair<std::chrono::steady_clock::time_point, TaskId>;

  SteadyClock steady_clock_;
  const Clock* clock_;
  std::map<Key, Task> tasks_;
  std::map<TaskId, Key> index_;
  TaskId next_id_ = 1;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_CORE_TASK_SCHEDULER_H_
