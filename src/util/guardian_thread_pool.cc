#include "guardian_thread_pool.h"
#include <algorithm>

namespace guardian {

ThreadPool::ThreadPool(size_t num_threads) {
  if (num_threads == 0) {
    num_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
  }

  worker_count_ = num_threads;
  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this);
  }
}

ThreadPool::~ThreadPool() {
  Shutdown();
}

void ThreadPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      return;
    }
    shutdown_.store(true, std::memory_order_release);
  }

  queue_cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  workers_.clear();
}

size_t ThreadPool::GetQueueSize() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  size_t total = 0;
  for (const auto& q : priority_queues_) {
    total += q.size();
  }
  return total;
}

bool ThreadPool::HasQueuedTasks() const {
  for (const auto& q : priority_queues_) {
    if (!q.empty()) {
      return true;
    }
  }
  return false;
}

void ThreadPool::WorkerLoop() {
  while (true) {
    Task task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || HasQueuedTasks();
      });

      if (!HasQueuedTasks()) {
        return;  // Shutdown with an empty queue
      }

      // Highest priority first
      for (int i = static_cast<int>(TaskPriority::HIGH); i >= 0; --i) {
        auto& q = priority_queues_[i];
        if (!q.empty()) {
          task = std::move(q.front());
          q.pop();
          break;
        }
      }
    }

    uint64_t waited = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - task.submitted).count());
    uint64_t busiest = metrics_.busiest_wait_us.load(std::memory_order_relaxed);
    while (waited > busiest &&
           !metrics_.busiest_wait_us.compare_exchange_weak(busiest, waited,
                                                           std::memory_order_relaxed)) {
    }

    task.func();
    metrics_.tasks_completed.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace guardian
