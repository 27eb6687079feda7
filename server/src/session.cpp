#include "server/session.hpp"

#include <chrono>

namespace livequiz::server {

std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::Idle:
      return "idle";
    case SessionState::Running:
      return "running";
    case SessionState::Ended:
      return "ended";
  }
  return "idle";
}

QuizSession::QuizSession(std::string id, std::vector<Question> questions)
    : id_(std::move(id)), questions_(std::move(questions)) {}

bool QuizSession::start(std::string* error) {
  if (state_ == SessionState::Running) {
    if (error) *error = "quiz already in progress";
    return false;
  }
  if (state_ == SessionState::Ended) {
    if (error) *error = "quiz already ended";
    return false;
  }
  state_ = SessionState::Running;
  current_index_ = -1;
  started_at_ = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  return true;
}

std::optional<Question> QuizSession::next_question() {
  if (state_ != SessionState::Running) return std::nullopt;
  if (current_index_ + 1 >= static_cast<int>(questions_.size())) {
    // Park the cursor one past the end so current_question() reports nothing.
    current_index_ = static_cast<int>(questions_.size());
    return std::nullopt;
  }
  ++current_index_;
  return questions_[static_cast<std::size_t>(current_index_)];
}

void QuizSession::end() {
  state_ = SessionState::Ended;
}

const Question* QuizSession::current_question() const {
  if (state_ != SessionState::Running) return nullptr;
  if (current_index_ < 0 || current_index_ >= static_cast<int>(questions_.size())) {
    return nullptr;
  }
  return &questions_[static_cast<std::size_t>(current_index_)];
}

bool QuizSession::has_more_questions() const {
  return current_index_ + 1 < static_cast<int>(questions_.size());
}

}  // namespace livequiz::server
