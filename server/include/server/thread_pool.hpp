#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace livequiz::server {

// Worker pool that spawns a thread whenever queued work outnumbers idle
// workers. max_workers == 0 means no upper bound, which is what connection
// read loops need: each one blocks for the lifetime of its connection.
class ThreadPool {
 public:
  explicit ThreadPool(std::size_t max_workers = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Returns false once the pool is shutting down.
  bool enqueue(std::function<void()> task);

  // Runs the queued tasks to completion and joins every worker.
  void shutdown();

  std::size_t size() const;

 private:
  void worker_loop();

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> tasks_;
  bool stopping_{false};
  std::size_t idle_{0};
  std::size_t max_workers_;
  std::vector<std::thread> threads_;
};

}  // namespace livequiz::server
