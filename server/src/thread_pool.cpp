#include "server/thread_pool.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace livequiz::server {

ThreadPool::ThreadPool(std::size_t max_workers) : max_workers_(max_workers) {}

ThreadPool::~ThreadPool() {
  shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return false;
    tasks_.push(std::move(task));
    const bool can_grow = max_workers_ == 0 || threads_.size() < max_workers_;
    if (tasks_.size() > idle_ && can_grow) {
      threads_.emplace_back(&ThreadPool::worker_loop, this);
    }
  }
  cv_.notify_one();
  return true;
}

void ThreadPool::shutdown() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return;
    stopping_ = true;
    threads.swap(threads_);
  }
  cv_.notify_all();
  for (auto& t : threads) {
    if (t.joinable()) t.join();
  }
}

std::size_t ThreadPool::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return threads_.size();
}

void ThreadPool::worker_loop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      ++idle_;
      cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
      --idle_;
      if (stopping_ && tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    try {
      task();
    } catch (const std::exception& ex) {
      spdlog::error("pool task threw: {}", ex.what());
    }
  }
}

}  // namespace livequiz::server
