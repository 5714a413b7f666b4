// File: include/mvr/rt/ThreadPool.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mvr::rt {

class ThreadPool {
public:
  explicit ThreadPool(unsigned nThreads = std::thread::hardware_concurrency());
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&)                 = delete;
  ThreadPool& operator=(ThreadPool&&)      = delete;

  // Enqueue work. Returns false once the pool is shutting down.
  bool post(std::function<void()> fn);

  // Waits until the queue is empty and no task is running.
  void drain();

  // Runs queued tasks to completion, then joins the workers. Idempotent.
  void shutdown();

  std::size_t size() const { return threads_.size(); }

private:
  void workerLoop();

  std::vector<std::thread>          threads_;
  std::mutex                        mx_;
  std::condition_variable           cv_;
  std::condition_variable           idleCv_;
  std::queue<std::function<void()>> q_;
  std::size_t                       active_{0};
  std::atomic<bool>                 stopping_{false};
};

} // namespace mvr::rt
