#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace livequiz::server {

using TaskId = std::uint64_t;

// Delayed and fixed-rate tasks on one dedicated worker thread.
// Tasks run outside the scheduler lock, so cancel() never waits for a task
// that is already executing; callers that need a hard cut-off check their
// own state when the task runs.
class Scheduler {
 public:
  Scheduler();
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Returns 0 if the scheduler has been shut down.
  TaskId schedule_after(std::chrono::milliseconds delay, std::function<void()> task);
  TaskId schedule_every(std::chrono::milliseconds initial_delay,
                        std::chrono::milliseconds period,
                        std::function<void()> task);

  // False if the task already ran (one-shot) or was never scheduled.
  bool cancel(TaskId id);

  // Drops pending tasks and joins the worker. Must not be called from a task.
  void shutdown();

  std::size_t pending() const;

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    std::chrono::milliseconds period{0};  // zero for one-shot tasks
    std::function<void()> task;
  };

  TaskId add(Clock::time_point due, std::chrono::milliseconds period,
             std::function<void()> task);
  void worker_loop();

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::multimap<Clock::time_point, TaskId> queue_;
  std::map<TaskId, Entry> tasks_;
  TaskId next_id_{1};
  bool stopping_{false};
  std::thread worker_;
};

}  // namespace livequiz::server
