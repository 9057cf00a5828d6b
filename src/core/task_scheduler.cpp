// Copyright 2026 The skitch Authors

#include "core/task_scheduler.h"

namespace skitch {
namespace internal {

TaskScheduler::TaskScheduler(const Clock* clock)
    : clock_(clock ? clock : &steady_clock_) {}

TaskScheduler::TaskId TaskScheduler::PostDelayed(
    std::chrono::milliseconds delay, Task task) {
  if (delay.count() < 0) delay = std::chrono::milliseconds(0);
  TaskId id = next_id_++;
  Key key(clock_->Now() + delay, id);
  tasks_.emplace(key, std::move(task));
  index_.emplace(id, key);
  return id;
}

bool TaskScheduler::Cancel(TaskId id) {
  auto it = index_.find(id);
  if (it == index_.end()) return false;
  tasks_.erase(it->second);
  index_.erase(it);
  return true;
}

bool TaskScheduler::IsPending(TaskId id) const {
  return index_.count(id) != 0;
}

int TaskScheduler::RunDue() {
  int ran = 0;
  auto now = clock_->Now();
  while (!tasks_.empty()) {
    auto it = tasks_.begin();
    if (it->first.first > now) break;
    // Detach before running: the task may post or cancel others.
    Task task = std::move(it->second);
    index_.erase(it->first.second);
    tasks_.erase(it);
    task();
    ++ran;
  }
  return ran;
}

bool TaskScheduler::NextDeadline(
    std::chrono::steady_clock::time_point* out) const {
  if (tasks_.empty()) return false;
  if (out) *out = tasks_.begin()->first.first;
  return true;
}

}  // namespace internal
}  // namespace skitch
