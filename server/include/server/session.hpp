#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "server/question_bank.hpp"

namespace livequiz::server {

enum class SessionState { Idle, Running, Ended };

std::string to_string(SessionState state);

// One quiz run: ordered questions and a cursor that only moves forward.
// A new quiz gets a new QuizSession; a finished one is never restarted.
class QuizSession {
 public:
  QuizSession(std::string id, std::vector<Question> questions);

  // Idle -> Running. Fails with "quiz already in progress" while running and
  // with "quiz already ended" afterwards.
  bool start(std::string* error = nullptr);

  // Advances the cursor. Returns std::nullopt once the questions are
  // exhausted (or when not running); the caller ends the quiz then.
  std::optional<Question> next_question();

  void end();

  const Question* current_question() const;
  bool has_more_questions() const;
  bool question_active() const { return current_question() != nullptr; }

  SessionState state() const { return state_; }
  bool running() const { return state_ == SessionState::Running; }
  const std::string& id() const { return id_; }
  int current_index() const { return current_index_; }
  std::size_t total_questions() const { return questions_.size(); }
  std::uint64_t started_at() const { return started_at_; }

 private:
  std::string id_;
  std::vector<Question> questions_;
  int current_index_{-1};
  SessionState state_{SessionState::Idle};
  std::uint64_t started_at_{0};
};

}  // namespace livequiz::server
