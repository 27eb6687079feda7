#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "server/countdown.hpp"
#include "server/participants.hpp"
#include "server/question_bank.hpp"

namespace livequiz::server {

struct AnswerResult {
  bool accepted{false};
  bool correct{false};
  int points_earned{0};
  std::string message;
  int total_score{0};
};

// Host-side view of the session. The coordinator calls these while holding
// its lock, in the same order the matching messages are broadcast;
// implementations must return quickly and must not call back into the
// coordinator.
class SessionObserver {
 public:
  virtual ~SessionObserver() = default;

  virtual void on_quiz_started(const std::string& /*session_id*/, std::size_t /*questions*/) {}
  virtual void on_question_broadcast(const Question& /*question*/, int /*index*/, int /*total*/) {}
  virtual void on_timer_tick(int /*remaining*/, TimerLabel /*label*/, std::size_t /*answered*/,
                             std::size_t /*participants*/) {}
  virtual void on_timer_control(const std::string& /*action*/, int /*value*/) {}
  virtual void on_answer_recorded(const std::string& /*participant_id*/,
                                  const AnswerResult& /*result*/) {}
  virtual void on_leaderboard_update(const std::vector<LeaderboardEntry>& /*board*/) {}
  virtual void on_participants_changed(std::size_t /*count*/) {}
  virtual void on_quiz_ended(const std::vector<LeaderboardEntry>& /*board*/) {}
};

}  // namespace livequiz::server
