#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

// Fixed-size worker pool used for collaborator calls and batch detection.
// Tasks are plain closures; results come back through std::future.

namespace guardian {

enum class TaskPriority {
  NORMAL = 0,
  HIGH = 1  // Collaborator calls that a caller is blocked on
};

struct TaskMetrics {
  std::atomic<uint64_t> tasks_submitted{0};
  std::atomic<uint64_t> tasks_completed{0};
  std::atomic<uint64_t> busiest_wait_us{0};  // Longest time a task sat queued
};

class ThreadPool {
public:
  // num_threads = 0 uses hardware_concurrency
  explicit ThreadPool(size_t num_threads = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // Submit a task with priority. After Shutdown() the returned future is
  // not valid(); callers must check before waiting on it.
  template<typename F, typename... Args>
  auto Submit(TaskPriority priority, F&& f, Args&&... args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  template<typename F, typename... Args>
  auto Submit(F&& f, Args&&... args)
      -> std::future<typename std::invoke_result<F, Args...>::type> {
    return Submit(TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
  }

  // Drains queued tasks, then joins the workers
  void Shutdown();

  const TaskMetrics& GetMetrics() const { return metrics_; }
  size_t GetWorkerCount() const { return worker_count_; }
  size_t GetQueueSize() const;
  bool IsShutdown() const { return shutdown_.load(std::memory_order_acquire); }

private:
  struct Task {
    std::function<void()> func;
    std::chrono::steady_clock::time_point submitted;
  };

  void WorkerLoop();
  bool HasQueuedTasks() const;

  std::vector<std::thread> workers_;
  size_t worker_count_ = 0;

  std::array<std::queue<Task>, 2> priority_queues_;  // One per TaskPriority
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;

  std::atomic<bool> shutdown_{false};
  TaskMetrics metrics_;
};

template<typename F, typename... Args>
auto ThreadPool::Submit(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...)
  );

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      return std::future<return_type>();
    }

    Task t;
    t.func = [task]() { (*task)(); };
    t.submitted = std::chrono::steady_clock::now();

    priority_queues_[static_cast<int>(priority)].push(std::move(t));
    metrics_.tasks_submitted.fetch_add(1, std::memory_order_relaxed);
  }

  queue_cv_.notify_one();
  return task->get_future();
}

}  // namespace guardian
