#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/message.hpp"
#include "server/answer_tracker.hpp"
#include "server/countdown.hpp"
#include "server/observer.hpp"
#include "server/outbox.hpp"
#include "server/participants.hpp"
#include "server/peer.hpp"
#include "server/scheduler.hpp"
#include "server/scoring.hpp"
#include "server/session.hpp"

namespace livequiz::server {

struct CoordinatorConfig {
  AdvancePolicy advance_policy{AdvancePolicy::WaitForAll};
  std::chrono::milliseconds advance_delay{3000};   // pause before auto-advancing
  std::chrono::milliseconds start_delay{3000};     // QUIZ_START -> first QUESTION
  std::chrono::milliseconds timeout_buffer{5000};  // added to the question time limit
  std::chrono::milliseconds tick_interval{1000};   // TIMER_SYNC period
};

struct CoordinatorStatus {
  std::string label;  // stopped, idle, running, paused, ended
  std::string session_id;
  int question_number{0};  // 1-based, 0 when no question is on screen
  std::size_t total_questions{0};
  int remaining{0};
  TimerLabel timer_label{TimerLabel::Normal};
  std::size_t answered{0};
  std::size_t acknowledged{0};
  std::size_t participants{0};
  std::size_t connections{0};
  AdvancePolicy advance_policy{AdvancePolicy::WaitForAll};
  std::string scoring_policy;
};

// Owns the authoritative quiz state and everything that mutates it. Every
// public operation is one critical section on a single mutex; scheduled
// work (timer ticks, auto-advance, question timeouts) re-enters through the
// same mutex and is discarded if the question it was armed for is gone.
class SessionCoordinator {
 public:
  explicit SessionCoordinator(CoordinatorConfig config = {},
                              std::unique_ptr<ScoringPolicy> scoring = nullptr);
  ~SessionCoordinator();

  SessionCoordinator(const SessionCoordinator&) = delete;
  SessionCoordinator& operator=(const SessionCoordinator&) = delete;

  // Not owned; must outlive the coordinator or be reset to nullptr.
  void set_observer(SessionObserver* observer);

  // Connections
  void accept_connection(std::shared_ptr<Peer> peer);
  void remove_connection(ConnectionId connection);
  bool join(ConnectionId connection,
            const std::string& participant_id,
            const std::string& name,
            std::string* error = nullptr);
  void chat(ConnectionId connection, const std::string& text);
  void acknowledge(ConnectionId connection, const std::string& message_id);
  void reject(ConnectionId connection, const std::string& reason);

  // Quiz flow
  bool start_quiz(std::vector<Question> questions, std::string* error = nullptr);
  bool send_next_question(std::string* error = nullptr);
  AnswerResult record_answer(const std::string& participant_id,
                             int question_id,
                             int option,
                             std::int64_t latency_ms);
  AnswerResult submit_answer(ConnectionId connection,
                             int question_id,
                             int option,
                             std::int64_t latency_ms);
  bool end_quiz();

  // Timer controls
  bool pause(std::string* error = nullptr);
  bool resume(std::string* error = nullptr);
  bool extend(int seconds, std::string* error = nullptr);
  bool skip(std::string* error = nullptr);
  bool force_next(std::string* error = nullptr);

  void broadcast(MessageType type, const std::string& payload);
  void announce(const std::string& text);

  CoordinatorStatus status() const;
  std::vector<LeaderboardEntry> leaderboard() const;
  std::vector<AnswerRecord> history(const std::string& participant_id) const;
  std::vector<QuestionAnalytics> analytics() const;
  std::string results_summary() const;
  std::string analytics_report() const;
  std::size_t connection_count() const;

  // Waits until every message emitted so far has been written.
  void flush();
  // Cancels scheduled work and closes every connection. Idempotent.
  void shutdown();

 private:
  bool require_question_locked(const char* op, std::string* error) const;
  bool advance_locked(const std::string& reason, bool discard_answers, std::string* error);
  void start_question_locked(const Question& question, std::string message_id);
  void end_quiz_locked();
  void cancel_question_tasks_locked();
  void arm_timeout_locked(int remaining_seconds);
  void arm_advance_locked();
  void maybe_arm_advance_locked();
  std::size_t answered_present_locked() const;
  AnswerResult record_answer_locked(const std::string& participant_id,
                                    int question_id,
                                    int option,
                                    std::int64_t latency_ms);

  void on_tick(std::uint64_t epoch);
  void on_advance_due(std::uint64_t generation, const std::string& reason);
  void on_timeout_due(std::uint64_t generation);

  void broadcast_locked(const WireMessage& msg);
  void send_locked(ConnectionId connection, const WireMessage& msg);
  void send_result_locked(const std::string& participant_id, const AnswerResult& result);
  void broadcast_leaderboard_locked();
  void broadcast_roster_locked();

  mutable std::mutex mtx_;
  CoordinatorConfig config_;
  std::unique_ptr<ScoringPolicy> scoring_;
  SessionObserver* observer_{nullptr};

  std::map<ConnectionId, std::shared_ptr<Peer>> peers_;
  ParticipantRegistry registry_;
  std::unique_ptr<QuizSession> session_;
  AnswerTracker tracker_;
  CountdownTimer timer_;

  // Bumped on every question transition; timer ticks carry the value they
  // were armed with.
  std::uint64_t epoch_{0};
  TaskId tick_task_{0};
  TaskId advance_task_{0};
  TaskId timeout_task_{0};
  // Bumped whenever the advance or timeout task is cancelled or re-armed.
  // A task the scheduler has already dequeued runs anyway and must find
  // its own generation still current.
  std::uint64_t advance_gen_{0};
  std::uint64_t timeout_gen_{0};
  bool advance_held_{false};  // auto-advance suspended by pause
  bool shut_down_{false};

  Scheduler scheduler_;
  Outbox outbox_;
};

}  // namespace livequiz::server
