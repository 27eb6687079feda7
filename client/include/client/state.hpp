#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "common/message.hpp"
#include "common/payloads.hpp"

namespace livequiz::client {

// What a participant currently sees, rebuilt from server messages only.
struct ParticipantState {
  std::string participant_id;
  std::string name;

  bool joined{false};
  bool quiz_running{false};
  bool quiz_over{false};
  int total_questions{0};
  int question_number{0};

  std::optional<QuestionView> question;
  std::chrono::steady_clock::time_point question_shown_at{};
  bool answered{false};
  int chosen_option{-1};

  int remaining{0};
  std::string timer_state{"normal"};
  bool paused{false};

  int score{0};
  std::optional<ResultView> last_result;
  std::vector<LeaderboardRow> leaderboard;
  std::deque<std::string> messages;  // chat and announcements, newest last
  std::string last_error;
};

constexpr std::size_t kMaxChatLines = 50;

// Folds one server message into the state. Returns the replies the client
// owes the server (an ACK for every QUESTION that carries an id). Malformed
// payloads leave the state untouched and fill error.
std::vector<WireMessage> apply_message(ParticipantState& state, const WireMessage& msg,
                                       std::string& error);

// Builds the ANSWER for the question on screen, with the latency measured
// from when it arrived. Fails if there is no question or it was answered.
std::optional<WireMessage> make_answer(ParticipantState& state, int option,
                                       std::chrono::steady_clock::time_point now,
                                       std::string& error);

WireMessage make_join(const ParticipantState& state);

}  // namespace livequiz::client
