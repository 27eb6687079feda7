#include "server/scheduler.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace livequiz::server {

Scheduler::Scheduler() {
  worker_ = std::thread(&Scheduler::worker_loop, this);
}

Scheduler::~Scheduler() {
  shutdown();
}

TaskId Scheduler::schedule_after(std::chrono::milliseconds delay, std::function<void()> task) {
  return add(Clock::now() + delay, std::chrono::milliseconds(0), std::move(task));
}

TaskId Scheduler::schedule_every(std::chrono::milliseconds initial_delay,
                                 std::chrono::milliseconds period,
                                 std::function<void()> task) {
  if (period.count() <= 0) period = std::chrono::milliseconds(1);
  return add(Clock::now() + initial_delay, period, std::move(task));
}

TaskId Scheduler::add(Clock::time_point due, std::chrono::milliseconds period,
                      std::function<void()> task) {
  TaskId id = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return 0;
    id = next_id_++;
    tasks_.emplace(id, Entry{period, std::move(task)});
    queue_.emplace(due, id);
  }
  cv_.notify_one();
  return id;
}

bool Scheduler::cancel(TaskId id) {
  if (id == 0) return false;
  std::lock_guard<std::mutex> lock(mtx_);
  // The queue slot is left behind and skipped when it comes due.
  return tasks_.erase(id) > 0;
}

void Scheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return;
    stopping_ = true;
    tasks_.clear();
    queue_.clear();
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

std::size_t Scheduler::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return tasks_.size();
}

void Scheduler::worker_loop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_) return;

      auto next = queue_.begin();
      const auto due = next->first;
      if (due > Clock::now()) {
        // Woken early by a new (possibly earlier) task or by shutdown.
        cv_.wait_until(lock, due);
        continue;
      }

      const TaskId id = next->second;
      queue_.erase(next);
      auto it = tasks_.find(id);
      if (it == tasks_.end()) continue;  // cancelled

      if (it->second.period.count() > 0) {
        task = it->second.task;
        auto next_due = due + it->second.period;
        const auto now = Clock::now();
        if (next_due < now) next_due = now + it->second.period;
        queue_.emplace(next_due, id);
      } else {
        task = std::move(it->second.task);
        tasks_.erase(it);
      }
    }

    try {
      task();
    } catch (const std::exception& ex) {
      spdlog::error("scheduled task threw: {}", ex.what());
    }
  }
}

}  // namespace livequiz::server
