#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/payloads.hpp"
#include "server/peer.hpp"

namespace livequiz::server {

struct Participant {
  std::string id;
  std::string name;
  int score{0};
  int answered_questions{0};
  int correct_answers{0};
  int streak{0};
  std::uint64_t connected_at{};  // Unix timestamp (ms)

  double accuracy() const {
    if (answered_questions == 0) return 0.0;
    return static_cast<double>(correct_answers) / answered_questions * 100.0;
  }
};

struct AnswerRecord {
  int question_id{};
  int option{};
  bool correct{false};
  int points_earned{0};
  std::int64_t latency_ms{0};
  std::uint64_t submitted_at{};  // Unix timestamp (ms)
};

struct LeaderboardEntry {
  int rank{};
  std::string participant_id;
  std::string name;
  int score{};
  int correct{};
  int answered{};
};

struct QuestionAnalytics {
  int question_id{};
  int attempts{};
  int correct{};
  double accuracy{};        // percent
  double average_ms{};
  std::int64_t fastest_ms{};
  std::int64_t slowest_ms{};
};

std::vector<LeaderboardRow> to_rows(const std::vector<LeaderboardEntry>& entries);

// Participant id <-> connection <-> score state, plus per-participant answer
// history. Not synchronized: the coordinator calls it under its own lock.
class ParticipantRegistry {
 public:
  bool add(ConnectionId connection,
           const std::string& id,
           const std::string& name,
           std::string* error = nullptr);

  std::optional<Participant> remove_connection(ConnectionId connection);

  const Participant* find(const std::string& id) const;
  std::optional<std::string> participant_for(ConnectionId connection) const;
  std::optional<ConnectionId> connection_for(const std::string& id) const;
  bool contains(const std::string& id) const;
  std::size_t count() const { return participants_.size(); }

  // Applies a scored answer: answered/correct/score/streak plus history.
  bool apply_answer(const std::string& id, const AnswerRecord& record);

  // Fresh run: zero scores and counters, clear history, keep who is connected.
  void reset_scores();

  // Drops the history entries of a question (skipped questions are excluded
  // from analytics). Scores are left alone.
  void forget_question(int question_id);

  std::vector<LeaderboardEntry> leaderboard() const;
  std::vector<LeaderboardEntry> top(std::size_t count) const;
  int rank_of(const std::string& id) const;  // 1-based, -1 if unknown
  std::vector<AnswerRecord> history(const std::string& id) const;
  std::vector<QuestionAnalytics> analytics() const;

  std::string results_summary() const;
  std::string analytics_report() const;

 private:
  std::map<std::string, Participant> participants_;
  std::map<ConnectionId, std::string> by_connection_;
  std::map<std::string, ConnectionId> connection_of_;
  std::map<std::string, std::vector<AnswerRecord>> history_;
  // History of participants who already left still counts for analytics.
  std::vector<AnswerRecord> departed_history_;
};

}  // namespace livequiz::server
