#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace epicflow::exec {

using Task = std::function<void()>;

/*
  Thread-safe blocking task queue for the worker pool.
*/
class WorkQueue {
 public:
  // False once shut down; the task is dropped.
  bool Enqueue(Task task);

  // blocking wait; nullopt after shutdown once drained
  std::optional<Task> Dequeue();

  void Shutdown();

  bool IsShutdown() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace epicflow::exec
