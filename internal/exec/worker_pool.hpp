#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "work_queue.hpp"

namespace epicflow::exec {

/*
  Fixed set of threads draining a WorkQueue.

  Stop() lets queued tasks finish, then joins. A task that throws is
  logged and the worker moves on. Submit is refused outside
  Start()..Stop().
*/
class WorkerPool {
 public:
  WorkerPool(std::shared_ptr<WorkQueue> queue, std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  // False unless the pool is running; the task is not queued.
  bool Submit(Task task);

  bool IsRunning() const {
    return running_.load();
  }

  std::size_t Threads() const {
    return thread_count_;
  }

 private:
  void Run(std::size_t worker_index);

  std::shared_ptr<WorkQueue> queue_;
  std::size_t                thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace epicflow::exec
