#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace livequiz {

// Payload layouts for the typed messages. Builders never fail; parsers return
// std::nullopt and fill error on a malformed payload.

struct JoinRequest {
  std::string participant_id;
  std::string name;
};

// Latencies above this are refused on the wire; no question runs that long.
constexpr std::int64_t kMaxAnswerLatencyMs = 24LL * 60 * 60 * 1000;

struct AnswerSubmission {
  int question_id{};
  int option{};
  std::int64_t latency_ms{};
};

// A question as participants see it: the correct option is never sent.
struct QuestionView {
  int id{};
  std::string text;
  int time_limit{};
  int points{};
  std::array<std::string, 4> options;
};

struct ResultView {
  bool correct{false};
  int points_earned{0};
  std::string message;
  int total_score{0};
};

struct LeaderboardRow {
  int rank{};
  std::string name;
  int score{};
  int correct{};
  int answered{};
};

struct TimerSyncView {
  int remaining{};
  std::string state;  // normal, warning, critical
};

struct TimerControlView {
  std::string action;  // pause, resume, extend
  int value{};
};

std::optional<int> parse_int(const std::string& text);
std::optional<std::int64_t> parse_int64(const std::string& text);

std::string join_payload(const JoinRequest& join);
std::optional<JoinRequest> parse_join(const std::string& payload, std::string& error);

std::string answer_payload(const AnswerSubmission& answer);
std::optional<AnswerSubmission> parse_answer(const std::string& payload, std::string& error);

std::string question_payload(const QuestionView& question);
std::optional<QuestionView> parse_question(const std::string& payload, std::string& error);

std::string result_payload(const ResultView& result);
std::optional<ResultView> parse_result(const std::string& payload, std::string& error);

std::string leaderboard_payload(const std::vector<LeaderboardRow>& rows);
std::optional<std::vector<LeaderboardRow>> parse_leaderboard(const std::string& payload,
                                                             std::string& error);

std::string timer_sync_payload(const TimerSyncView& sync);
std::optional<TimerSyncView> parse_timer_sync(const std::string& payload, std::string& error);

std::string timer_control_payload(const TimerControlView& control);
std::optional<TimerControlView> parse_timer_control(const std::string& payload,
                                                    std::string& error);

}  // namespace livequiz
