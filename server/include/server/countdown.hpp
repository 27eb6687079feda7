#pragma once

#include <chrono>
#include <string>

namespace livequiz::server {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

enum class TimerLabel { Normal, Warning, Critical };

std::string to_string(TimerLabel label);

// critical <= 10s, warning <= 30s, else normal.
TimerLabel label_for(int remaining_seconds);

// Countdown state of the active question. Every call takes `now` so the
// arithmetic can be driven by a fake clock. Not synchronized.
class CountdownTimer {
 public:
  void start(int time_limit_seconds, TimePoint now);
  void stop();

  // max(0, limit - whole elapsed seconds), or the frozen value while paused.
  int remaining(TimePoint now) const;

  // Returns false if not running or already paused.
  bool pause(TimePoint now);
  // Continues from the frozen value. Returns false if not paused.
  bool resume(TimePoint now);
  // Adds to the limit (and to the frozen value while paused).
  bool extend(int seconds);

  bool active() const { return active_; }
  bool paused() const { return paused_; }
  int time_limit() const { return time_limit_; }

 private:
  bool active_{false};
  int time_limit_{0};
  TimePoint started_at_{};
  bool paused_{false};
  int frozen_remaining_{0};
};

}  // namespace livequiz::server
