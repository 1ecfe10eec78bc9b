#include "work_queue.hpp"

namespace epicflow::exec {

bool WorkQueue::Enqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<Task> WorkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void WorkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool WorkQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

} // namespace epicflow::exec
