#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace shacrypt::tool {

// Fixed set of workers draining a FIFO of tasks. Tasks must not throw.
class ThreadPool {
 public:
  explicit ThreadPool(std::size_t workers);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Returns false once shutdown has started.
  bool enqueue(std::function<void()> task);
  // Blocks until the queue is empty and no task is running.
  void wait_idle();
  void shutdown();

  std::size_t size() const { return threads_.size(); }

 private:
  void worker_loop();

  std::mutex mtx_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<std::function<void()>> tasks_;
  std::size_t active_{0};
  bool stopping_{false};
  std::vector<std::thread> threads_;
};

}  // namespace shacrypt::tool
