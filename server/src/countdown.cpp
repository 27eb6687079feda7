#include "server/countdown.hpp"

#include <algorithm>

namespace livequiz::server {

std::string to_string(TimerLabel label) {
  switch (label) {
    case TimerLabel::Normal:
      return "normal";
    case TimerLabel::Warning:
      return "warning";
    case TimerLabel::Critical:
      return "critical";
  }
  return "normal";
}

TimerLabel label_for(int remaining_seconds) {
  if (remaining_seconds <= 10) return TimerLabel::Critical;
  if (remaining_seconds <= 30) return TimerLabel::Warning;
  return TimerLabel::Normal;
}

void CountdownTimer::start(int time_limit_seconds, TimePoint now) {
  active_ = true;
  time_limit_ = time_limit_seconds;
  started_at_ = now;
  paused_ = false;
  frozen_remaining_ = 0;
}

void CountdownTimer::stop() {
  active_ = false;
  paused_ = false;
  frozen_remaining_ = 0;
}

int CountdownTimer::remaining(TimePoint now) const {
  if (!active_) return 0;
  if (paused_) return frozen_remaining_;
  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - started_at_).count();
  return std::max(0, time_limit_ - static_cast<int>(elapsed));
}

bool CountdownTimer::pause(TimePoint now) {
  if (!active_ || paused_) return false;
  frozen_remaining_ = remaining(now);
  paused_ = true;
  return true;
}

bool CountdownTimer::resume(TimePoint now) {
  if (!active_ || !paused_) return false;
  // Rewind the start so that limit - elapsed == frozen value.
  const int already_used = time_limit_ - frozen_remaining_;
  started_at_ = now - std::chrono::seconds(already_used);
  paused_ = false;
  return true;
}

bool CountdownTimer::extend(int seconds) {
  if (!active_ || seconds <= 0) return false;
  time_limit_ += seconds;
  if (paused_) frozen_remaining_ += seconds;
  return true;
}

}  // namespace livequiz::server
