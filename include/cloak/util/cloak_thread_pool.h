#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <memory>
#include <type_traits>

// Fixed-size worker pool used by the batch pipeline to mask documents in
// parallel. Tasks run in submission order; results come back through futures,
// so callers place outputs by index and never depend on completion order.
// An exception thrown by a task is stored in its future.

namespace cloak {

class ThreadPool {
public:
  // If num_threads = 0, uses hardware_concurrency (CPU-bound regex work)
  explicit ThreadPool(size_t num_threads = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // Submit a task, returns future for result. After Shutdown() the returned
  // future is invalid (valid() == false) and the task never runs.
  template<typename F, typename... Args>
  auto Submit(F&& f, Args&&... args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  // Waits for queued tasks to finish, then joins the workers
  void Shutdown();

  size_t GetWorkerCount() const { return workers_.size(); }

private:
  void WorkerLoop();

  std::vector<std::thread> workers_;

  std::queue<std::function<void()>> queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;

  std::atomic<bool> shutdown_{false};
};

// ============================================================
// Template Implementations
// ============================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
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

    queue_.push([task]() { (*task)(); });
  }

  queue_cv_.notify_one();
  return task->get_future();
}

}  // namespace cloak
