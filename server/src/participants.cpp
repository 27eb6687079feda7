#include "server/participants.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

#include <spdlog/fmt/fmt.h>

namespace livequiz::server {

namespace {
std::uint64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
}  // namespace

std::vector<LeaderboardRow> to_rows(const std::vector<LeaderboardEntry>& entries) {
  std::vector<LeaderboardRow> rows;
  rows.reserve(entries.size());
  for (const auto& e : entries) {
    rows.push_back(LeaderboardRow{e.rank, e.name, e.score, e.correct, e.answered});
  }
  return rows;
}

bool ParticipantRegistry::add(ConnectionId connection,
                              const std::string& id,
                              const std::string& name,
                              std::string* error) {
  if (id.empty() || name.empty()) {
    if (error) *error = "participant id and name are required";
    return false;
  }
  if (by_connection_.count(connection)) {
    if (error) *error = "connection already joined as " + by_connection_[connection];
    return false;
  }
  if (participants_.count(id)) {
    if (error) *error = "participant id " + id + " is already connected";
    return false;
  }
  Participant p;
  p.id = id;
  p.name = name;
  p.connected_at = now_ms();
  participants_.emplace(id, std::move(p));
  by_connection_[connection] = id;
  connection_of_[id] = connection;
  return true;
}

std::optional<Participant> ParticipantRegistry::remove_connection(ConnectionId connection) {
  auto it = by_connection_.find(connection);
  if (it == by_connection_.end()) return std::nullopt;
  std::string id = it->second;
  by_connection_.erase(it);
  connection_of_.erase(id);

  auto hist = history_.find(id);
  if (hist != history_.end()) {
    departed_history_.insert(departed_history_.end(), hist->second.begin(), hist->second.end());
    history_.erase(hist);
  }

  auto p = participants_.find(id);
  if (p == participants_.end()) return std::nullopt;
  Participant removed = std::move(p->second);
  participants_.erase(p);
  return removed;
}

const Participant* ParticipantRegistry::find(const std::string& id) const {
  auto it = participants_.find(id);
  return it == participants_.end() ? nullptr : &it->second;
}

std::optional<std::string> ParticipantRegistry::participant_for(ConnectionId connection) const {
  auto it = by_connection_.find(connection);
  if (it == by_connection_.end()) return std::nullopt;
  return it->second;
}

std::optional<ConnectionId> ParticipantRegistry::connection_for(const std::string& id) const {
  auto it = connection_of_.find(id);
  if (it == connection_of_.end()) return std::nullopt;
  return it->second;
}

bool ParticipantRegistry::contains(const std::string& id) const {
  return participants_.count(id) > 0;
}

bool ParticipantRegistry::apply_answer(const std::string& id, const AnswerRecord& record) {
  auto it = participants_.find(id);
  if (it == participants_.end()) return false;
  Participant& p = it->second;
  p.answered_questions += 1;
  if (record.correct) {
    p.correct_answers += 1;
    p.streak += 1;
    p.score += std::max(0, record.points_earned);
  } else {
    p.streak = 0;
  }
  history_[id].push_back(record);
  return true;
}

void ParticipantRegistry::reset_scores() {
  for (auto& [id, p] : participants_) {
    p.score = 0;
    p.answered_questions = 0;
    p.correct_answers = 0;
    p.streak = 0;
  }
  history_.clear();
  departed_history_.clear();
}

void ParticipantRegistry::forget_question(int question_id) {
  auto same_question = [question_id](const AnswerRecord& r) {
    return r.question_id == question_id;
  };
  for (auto& [id, records] : history_) {
    records.erase(std::remove_if(records.begin(), records.end(), same_question), records.end());
  }
  departed_history_.erase(
      std::remove_if(departed_history_.begin(), departed_history_.end(), same_question),
      departed_history_.end());
}

std::vector<LeaderboardEntry> ParticipantRegistry::leaderboard() const {
  std::vector<const Participant*> sorted;
  sorted.reserve(participants_.size());
  for (const auto& [id, p] : participants_) sorted.push_back(&p);
  std::sort(sorted.begin(), sorted.end(), [](const Participant* a, const Participant* b) {
    if (a->score != b->score) return a->score > b->score;
    if (a->correct_answers != b->correct_answers) return a->correct_answers > b->correct_answers;
    if (a->name != b->name) return a->name < b->name;
    return a->id < b->id;
  });

  std::vector<LeaderboardEntry> out;
  out.reserve(sorted.size());
  int rank = 1;
  for (const auto* p : sorted) {
    out.push_back(LeaderboardEntry{rank++, p->id, p->name, p->score, p->correct_answers,
                                   p->answered_questions});
  }
  return out;
}

std::vector<LeaderboardEntry> ParticipantRegistry::top(std::size_t count) const {
  auto board = leaderboard();
  if (board.size() > count) board.resize(count);
  return board;
}

int ParticipantRegistry::rank_of(const std::string& id) const {
  for (const auto& e : leaderboard()) {
    if (e.participant_id == id) return e.rank;
  }
  return -1;
}

std::vector<AnswerRecord> ParticipantRegistry::history(const std::string& id) const {
  auto it = history_.find(id);
  if (it == history_.end()) return {};
  return it->second;
}

std::vector<QuestionAnalytics> ParticipantRegistry::analytics() const {
  std::map<int, std::vector<const AnswerRecord*>> by_question;
  for (const auto& [id, records] : history_) {
    for (const auto& r : records) by_question[r.question_id].push_back(&r);
  }
  for (const auto& r : departed_history_) by_question[r.question_id].push_back(&r);

  std::vector<QuestionAnalytics> out;
  for (const auto& [qid, records] : by_question) {
    QuestionAnalytics a;
    a.question_id = qid;
    a.attempts = static_cast<int>(records.size());
    double total = 0;
    std::int64_t fastest = std::numeric_limits<std::int64_t>::max();
    std::int64_t slowest = 0;
    for (const auto* r : records) {
      if (r->correct) ++a.correct;
      total += static_cast<double>(r->latency_ms);
      fastest = std::min(fastest, r->latency_ms);
      slowest = std::max(slowest, r->latency_ms);
    }
    a.accuracy = a.attempts > 0 ? a.correct * 100.0 / a.attempts : 0.0;
    a.average_ms = a.attempts > 0 ? total / a.attempts : 0.0;
    a.fastest_ms = a.attempts > 0 ? fastest : 0;
    a.slowest_ms = slowest;
    out.push_back(a);
  }
  return out;
}

std::string ParticipantRegistry::results_summary() const {
  auto board = leaderboard();
  std::string out = "=== QUIZ RESULTS ===\n\n";
  out += fmt::format("Total Participants: {}\n\n", board.size());
  out += "LEADERBOARD:\n";
  out += "Rank | Name                 | Score | Correct | Accuracy\n";
  out += "-----|----------------------|-------|---------|---------\n";
  for (const auto& e : board) {
    double accuracy = e.answered > 0 ? e.correct * 100.0 / e.answered : 0.0;
    out += fmt::format("{:<4} | {:<20} | {:<5} | {:<7} | {:.1f}%\n", e.rank, e.name, e.score,
                       e.correct, accuracy);
  }
  return out;
}

std::string ParticipantRegistry::analytics_report() const {
  auto rows = analytics();
  std::string out = "=== QUESTION ANALYTICS ===\n\n";
  if (rows.empty()) {
    out += "No answers recorded yet.\n";
    return out;
  }
  out += fmt::format("{:<5} | {:<8} | {:<8} | {:<9} | {:<9} | {:<9} | {:<9}\n", "QID",
                     "Attempts", "Correct", "Accuracy", "Avg Time", "Fastest", "Slowest");
  out += std::string(73, '-') + "\n";
  for (const auto& a : rows) {
    out += fmt::format("{:<5} | {:<8} | {:<8} | {:>8.2f}% | {:>8.2f}s | {:>8.2f}s | {:>8.2f}s\n",
                       a.question_id, a.attempts, a.correct, a.accuracy, a.average_ms / 1000.0,
                       a.fastest_ms / 1000.0, a.slowest_ms / 1000.0);
  }
  return out;
}

}  // namespace livequiz::server
