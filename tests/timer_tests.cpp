#include <chrono>

#include "server/countdown.hpp"
#include "test_runner.hpp"

using livequiz::server::CountdownTimer;
using livequiz::server::SteadyClock;
using livequiz::server::TimerLabel;
using livequiz::test::TestRunner;
using std::chrono::milliseconds;
using std::chrono::seconds;

int main() {
  TestRunner tr("timer");
  const auto t0 = SteadyClock::now();

  // Labels.
  {
    tr.expect(livequiz::server::label_for(45) == TimerLabel::Normal, "normal above 30");
    tr.expect(livequiz::server::label_for(30) == TimerLabel::Warning, "warning at 30");
    tr.expect(livequiz::server::label_for(11) == TimerLabel::Warning, "warning above 10");
    tr.expect(livequiz::server::label_for(10) == TimerLabel::Critical, "critical at 10");
    tr.expect(livequiz::server::label_for(0) == TimerLabel::Critical, "critical at 0");
    tr.expect(livequiz::server::to_string(TimerLabel::Warning) == "warning", "label text");
  }

  // Counting down with whole seconds, never below zero.
  {
    CountdownTimer t;
    tr.expect(t.remaining(t0) == 0 && !t.active(), "inactive timer reports zero");
    t.start(30, t0);
    tr.expect(t.remaining(t0) == 30, "full limit at start");
    tr.expect(t.remaining(t0 + milliseconds(999)) == 30, "partial seconds not counted");
    tr.expect(t.remaining(t0 + seconds(12)) == 18, "elapsed seconds subtracted");
    tr.expect(t.remaining(t0 + seconds(45)) == 0, "clamped at zero");
    t.stop();
    tr.expect(!t.active() && t.remaining(t0 + seconds(1)) == 0, "stopped");
  }

  // Pause freezes; resume continues from the frozen value.
  {
    CountdownTimer t;
    t.start(30, t0);
    tr.expect(t.pause(t0 + seconds(10)), "pause");
    tr.expect(!t.pause(t0 + seconds(11)), "double pause rejected");
    tr.expect(t.remaining(t0 + seconds(100)) == 20, "frozen while paused");
    tr.expect(t.resume(t0 + seconds(100)), "resume");
    tr.expect(!t.resume(t0 + seconds(100)), "resume without pause rejected");
    tr.expect(t.remaining(t0 + seconds(100)) == 20, "resumes where it stopped");
    tr.expect(t.remaining(t0 + seconds(105)) == 15, "counts down again");
  }

  // Extend adds to the limit, also while paused.
  {
    CountdownTimer t;
    t.start(30, t0);
    tr.expect(t.extend(15), "extend running timer");
    tr.expect(t.remaining(t0 + seconds(5)) == 40, "extension counted");
    tr.expect(!t.extend(0) && !t.extend(-5), "non-positive extension rejected");

    t.pause(t0 + seconds(10));
    tr.expect(t.extend(10), "extend paused timer");
    tr.expect(t.remaining(t0 + seconds(50)) == 45, "frozen value grows");
    t.resume(t0 + seconds(50));
    tr.expect(t.remaining(t0 + seconds(60)) == 35, "resumed with the extension");
    tr.expect(t.time_limit() == 55, "limit includes extensions");

    CountdownTimer idle;
    tr.expect(!idle.extend(10), "cannot extend an inactive timer");
    tr.expect(!idle.pause(t0), "cannot pause an inactive timer");
  }

  return tr.exit_code();
}
