#include "worker_pool.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"

namespace epicflow::exec {

using epicflow::observability::IntField;
using epicflow::observability::StringField;

WorkerPool::WorkerPool(std::shared_ptr<WorkQueue> queue, std::size_t threads)
    : queue_(std::move(queue)), thread_count_(std::max<std::size_t>(threads, 1)) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;

  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this, i);
  }
  EPICFLOW_LOG_INFO("Worker pool started", {IntField("threads", static_cast<std::int64_t>(thread_count_))});
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  if (!running_.exchange(false)) return;

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  EPICFLOW_LOG_INFO("Worker pool stopped");
}

bool WorkerPool::Submit(Task task) {
  // Nothing drains the queue before Start or after Stop.
  if (!running_.load()) return false;
  return queue_->Enqueue(std::move(task));
}

void WorkerPool::Run(std::size_t worker_index) {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      EPICFLOW_LOG_ERROR("Worker task failed", {IntField("worker", static_cast<std::int64_t>(worker_index)), StringField("error", e.what())});
    } catch (...) {
      EPICFLOW_LOG_ERROR("Worker task failed", {IntField("worker", static_cast<std::int64_t>(worker_index)), StringField("error", "unknown exception")});
    }
  }
}

} // namespace epicflow::exec
