#include "server/coordinator.hpp"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

#include "common/codec.hpp"
#include "common/crypto.hpp"
#include "common/payloads.hpp"

namespace livequiz::server {

namespace {

std::string one_line(std::string text) {
  std::replace(text.begin(), text.end(), '\n', ' ');
  std::replace(text.begin(), text.end(), '\r', ' ');
  return text;
}

void set_error(std::string* error, const std::string& value) {
  if (error) *error = value;
}

}  // namespace

SessionCoordinator::SessionCoordinator(CoordinatorConfig config,
                                       std::unique_ptr<ScoringPolicy> scoring)
    : config_(config),
      scoring_(scoring ? std::move(scoring) : std::make_unique<StreakBonusPolicy>()),
      tracker_(config.advance_policy),
      outbox_([this](const std::shared_ptr<Peer>& peer) {
        peer->close();
        remove_connection(peer->id());
      }) {}

SessionCoordinator::~SessionCoordinator() {
  shutdown();
}

void SessionCoordinator::set_observer(SessionObserver* observer) {
  std::lock_guard<std::mutex> lock(mtx_);
  observer_ = observer;
}

// -- Connections --------------------------------------------------------------

void SessionCoordinator::accept_connection(std::shared_ptr<Peer> peer) {
  if (!peer) return;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!shut_down_) {
      spdlog::info("connection {} accepted ({})", peer->id(), peer->describe());
      peers_[peer->id()] = std::move(peer);
      return;
    }
  }
  // close() reports back through remove_connection, so never under mtx_.
  peer->close();
}

void SessionCoordinator::remove_connection(ConnectionId connection) {
  std::lock_guard<std::mutex> lock(mtx_);
  const bool known = peers_.erase(connection) > 0;
  auto removed = registry_.remove_connection(connection);
  if (shut_down_) return;
  if (!removed) {
    if (known) spdlog::info("connection {} closed before joining", connection);
    return;
  }

  spdlog::info("participant {} ({}) disconnected", removed->name, removed->id);
  broadcast_locked(make_message(MessageType::Message, "[LEAVE] " + removed->name + " left"));
  broadcast_roster_locked();
  if (observer_) observer_->on_participants_changed(registry_.count());

  if (session_ && session_->question_active()) {
    broadcast_leaderboard_locked();
    // Under wait-for-all the remaining participants may now all have answered.
    maybe_arm_advance_locked();
  }
}

bool SessionCoordinator::join(ConnectionId connection,
                              const std::string& participant_id,
                              const std::string& name,
                              std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!peers_.count(connection)) {
    set_error(error, "unknown connection");
    spdlog::warn("join from unknown connection {}", connection);
    return false;
  }
  std::string why;
  if (!registry_.add(connection, participant_id, one_line(name), &why)) {
    spdlog::warn("join rejected on connection {}: {}", connection, why);
    send_locked(connection, make_message(MessageType::Error, why));
    set_error(error, why);
    return false;
  }

  const std::string clean_name = one_line(name);
  spdlog::info("participant joined: {} (ID: {})", clean_name, participant_id);
  send_locked(connection, make_message(MessageType::Ack, "Welcome " + clean_name + "!"));
  broadcast_locked(make_message(MessageType::Message, "[JOIN] " + clean_name + " joined"));
  broadcast_roster_locked();
  if (observer_) observer_->on_participants_changed(registry_.count());

  // Late joiners get the running quiz and the question on screen.
  if (session_ && session_->running()) {
    send_locked(connection, make_message(MessageType::QuizStart,
                                         std::to_string(session_->total_questions())));
    if (const Question* q = session_->current_question()) {
      send_locked(connection, make_message(MessageType::Question, tracker_.message_id(),
                                           question_payload(view_of(*q))));
      const int remaining = timer_.remaining(SteadyClock::now());
      send_locked(connection,
                  make_message(MessageType::TimerSync,
                               timer_sync_payload({remaining, to_string(label_for(remaining))})));
    }
  }
  return true;
}

void SessionCoordinator::chat(ConnectionId connection, const std::string& text) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto pid = registry_.participant_for(connection);
  if (!pid) {
    send_locked(connection, make_message(MessageType::Error, "join before chatting"));
    return;
  }
  const Participant* p = registry_.find(*pid);
  std::string line = (p ? p->name : *pid) + ": " + one_line(text);
  spdlog::info("chat {}", line);
  broadcast_locked(make_message(MessageType::Message, line));
}

void SessionCoordinator::acknowledge(ConnectionId connection, const std::string& message_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto pid = registry_.participant_for(connection);
  if (!pid) return;
  if (tracker_.acknowledge(*pid, message_id)) {
    spdlog::debug("{} acknowledged {} ({} acks)", *pid, message_id, tracker_.ack_count());
  }
}

void SessionCoordinator::reject(ConnectionId connection, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mtx_);
  send_locked(connection, make_message(MessageType::Error, reason));
}

// -- Quiz flow ----------------------------------------------------------------

bool SessionCoordinator::start_quiz(std::vector<Question> questions, std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (shut_down_) {
    set_error(error, "server stopped");
    return false;
  }
  if (session_ && session_->running()) {
    spdlog::warn("start rejected: quiz already in progress");
    set_error(error, "quiz already in progress");
    return false;
  }
  if (questions.empty()) {
    spdlog::warn("start rejected: no questions");
    set_error(error, "no questions to run");
    return false;
  }

  const std::size_t total = questions.size();
  auto next = std::make_unique<QuizSession>("SESSION-" + random_hex_id(4), std::move(questions));
  std::string why;
  if (!next->start(&why)) {
    set_error(error, why);
    return false;
  }

  cancel_question_tasks_locked();
  ++epoch_;
  timer_.stop();
  tracker_.clear();
  advance_held_ = false;
  registry_.reset_scores();
  session_ = std::move(next);

  spdlog::info("quiz {} started with {} questions", session_->id(), total);
  broadcast_locked(make_message(MessageType::QuizStart, std::to_string(total)));
  if (observer_) observer_->on_quiz_started(session_->id(), total);

  const std::uint64_t generation = ++advance_gen_;
  advance_task_ = scheduler_.schedule_after(config_.start_delay, [this, generation] {
    on_advance_due(generation, "quiz start countdown");
  });
  return true;
}

bool SessionCoordinator::send_next_question(std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  return advance_locked("manual next", false, error);
}

bool SessionCoordinator::force_next(std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  return advance_locked("forced next", false, error);
}

bool SessionCoordinator::skip(std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  return advance_locked("skip", true, error);
}

bool SessionCoordinator::end_quiz() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!session_ || !session_->running()) {
    spdlog::debug("end ignored: no quiz running");
    return false;
  }
  end_quiz_locked();
  return true;
}

AnswerResult SessionCoordinator::record_answer(const std::string& participant_id,
                                               int question_id,
                                               int option,
                                               std::int64_t latency_ms) {
  std::lock_guard<std::mutex> lock(mtx_);
  return record_answer_locked(participant_id, question_id, option, latency_ms);
}

AnswerResult SessionCoordinator::submit_answer(ConnectionId connection,
                                               int question_id,
                                               int option,
                                               std::int64_t latency_ms) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto pid = registry_.participant_for(connection);
  if (!pid) {
    send_locked(connection, make_message(MessageType::Error, "join before answering"));
    return AnswerResult{false, false, 0, "Participant not found", 0};
  }
  return record_answer_locked(*pid, question_id, option, latency_ms);
}

AnswerResult SessionCoordinator::record_answer_locked(const std::string& participant_id,
                                                      int question_id,
                                                      int option,
                                                      std::int64_t latency_ms) {
  AnswerResult result;
  const Question* q = session_ && session_->running() ? session_->current_question() : nullptr;
  const Participant* p = registry_.find(participant_id);
  if (p) result.total_score = p->score;

  if (!q) {
    result.message = "No active question";
  } else if (q->id != question_id) {
    result.message = "Invalid question";
  } else if (!p) {
    result.message = "Participant not found";
  } else if (option < 0 || option > 3) {
    result.message = "Invalid option";
  } else if (tracker_.has_answered(participant_id)) {
    result.message = "Already answered";
  }
  if (!result.message.empty()) {
    spdlog::info("answer from {} for Q{} rejected: {}", participant_id, question_id,
                 result.message);
    send_result_locked(participant_id, result);
    return result;
  }

  // Reported latency never exceeds the time the question was open.
  const std::int64_t open_ms = static_cast<std::int64_t>(q->time_limit) * 1000 +
                               static_cast<std::int64_t>(config_.timeout_buffer.count());
  latency_ms = std::min(std::max<std::int64_t>(latency_ms, 0), open_ms);

  ScoreInput input;
  input.correct = option == q->correct_index;
  input.response_ms = latency_ms;
  input.streak = p->streak;
  input.question_points = q->points;
  input.time_limit = q->time_limit;
  const int points = std::max(0, scoring_->points(input));

  AnswerRecord record;
  record.question_id = q->id;
  record.option = option;
  record.correct = input.correct;
  record.points_earned = input.correct ? points : 0;
  record.latency_ms = latency_ms;
  record.submitted_at = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());

  tracker_.record(participant_id);
  registry_.apply_answer(participant_id, record);

  result.accepted = true;
  result.correct = record.correct;
  result.points_earned = record.points_earned;
  result.message = record.correct ? "Correct! +" + std::to_string(record.points_earned) + " points"
                                  : "Incorrect";
  result.total_score = registry_.find(participant_id)->score;

  spdlog::info("{} answered Q{}: {} ({} ms, +{})", p->name, question_id,
               record.correct ? "correct" : "incorrect", latency_ms, record.points_earned);
  send_result_locked(participant_id, result);
  if (observer_) observer_->on_answer_recorded(participant_id, result);
  broadcast_leaderboard_locked();

  spdlog::info("question {}: {}/{} participants answered", q->id, answered_present_locked(),
               registry_.count());
  maybe_arm_advance_locked();
  return result;
}

// -- Timer controls -----------------------------------------------------------

bool SessionCoordinator::pause(std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!require_question_locked("pause", error)) return false;
  if (!timer_.pause(SteadyClock::now())) {
    spdlog::warn("pause rejected: timer already paused");
    set_error(error, "timer already paused");
    return false;
  }
  scheduler_.cancel(timeout_task_);
  timeout_task_ = 0;
  ++timeout_gen_;
  if (advance_task_ != 0) {
    scheduler_.cancel(advance_task_);
    advance_task_ = 0;
    advance_held_ = true;
  }
  ++advance_gen_;

  const int frozen = timer_.remaining(SteadyClock::now());
  broadcast_locked(
      make_message(MessageType::TimerControl, timer_control_payload({"pause", frozen})));
  if (observer_) observer_->on_timer_control("pause", frozen);
  spdlog::info("timer paused at {} seconds remaining", frozen);
  return true;
}

bool SessionCoordinator::resume(std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!require_question_locked("resume", error)) return false;
  const auto now = SteadyClock::now();
  if (!timer_.resume(now)) {
    spdlog::warn("resume rejected: timer is not paused");
    set_error(error, "timer is not paused");
    return false;
  }

  const int remaining = timer_.remaining(now);
  arm_timeout_locked(remaining);
  if (advance_held_) {
    advance_held_ = false;
    arm_advance_locked();
  }
  broadcast_locked(
      make_message(MessageType::TimerControl, timer_control_payload({"resume", remaining})));
  if (observer_) observer_->on_timer_control("resume", remaining);
  spdlog::info("timer resumed with {} seconds remaining", remaining);
  return true;
}

bool SessionCoordinator::extend(int seconds, std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (seconds <= 0) {
    spdlog::warn("extend rejected: {} is not a positive number of seconds", seconds);
    set_error(error, "extension must be a positive number of seconds");
    return false;
  }
  if (!require_question_locked("extend", error)) return false;
  const auto now = SteadyClock::now();
  timer_.extend(seconds);
  // While paused the timeout is re-armed on resume.
  if (!timer_.paused()) arm_timeout_locked(timer_.remaining(now));

  broadcast_locked(
      make_message(MessageType::TimerControl, timer_control_payload({"extend", seconds})));
  if (observer_) observer_->on_timer_control("extend", seconds);
  spdlog::info("timer extended by {}s ({}, {}s remaining)", seconds,
               timer_.paused() ? "paused" : "running", timer_.remaining(now));
  return true;
}

// -- Broadcast ----------------------------------------------------------------

void SessionCoordinator::broadcast(MessageType type, const std::string& payload) {
  std::lock_guard<std::mutex> lock(mtx_);
  broadcast_locked(make_message(type, payload));
}

void SessionCoordinator::announce(const std::string& text) {
  std::lock_guard<std::mutex> lock(mtx_);
  spdlog::info("announcement: {}", text);
  broadcast_locked(make_message(MessageType::Message, "[HOST] " + one_line(text)));
}

// -- Queries ------------------------------------------------------------------

CoordinatorStatus SessionCoordinator::status() const {
  std::lock_guard<std::mutex> lock(mtx_);
  CoordinatorStatus s;
  if (shut_down_) {
    s.label = "stopped";
  } else if (!session_) {
    s.label = "idle";
  } else if (!session_->running()) {
    s.label = "ended";
  } else {
    s.label = timer_.paused() ? "paused" : "running";
  }
  if (session_) {
    s.session_id = session_->id();
    s.total_questions = session_->total_questions();
    if (session_->question_active()) s.question_number = session_->current_index() + 1;
  }
  s.remaining = timer_.remaining(SteadyClock::now());
  s.timer_label = label_for(s.remaining);
  s.answered = answered_present_locked();
  s.acknowledged = tracker_.ack_count();
  s.participants = registry_.count();
  s.connections = peers_.size();
  s.advance_policy = config_.advance_policy;
  s.scoring_policy = scoring_->name();
  return s;
}

std::vector<LeaderboardEntry> SessionCoordinator::leaderboard() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return registry_.leaderboard();
}

std::vector<AnswerRecord> SessionCoordinator::history(const std::string& participant_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return registry_.history(participant_id);
}

std::vector<QuestionAnalytics> SessionCoordinator::analytics() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return registry_.analytics();
}

std::string SessionCoordinator::results_summary() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return registry_.results_summary();
}

std::string SessionCoordinator::analytics_report() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return registry_.analytics_report();
}

std::size_t SessionCoordinator::connection_count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return peers_.size();
}

void SessionCoordinator::flush() {
  outbox_.drain();
}

void SessionCoordinator::shutdown() {
  std::vector<std::shared_ptr<Peer>> peers;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shut_down_) return;
    shut_down_ = true;
    cancel_question_tasks_locked();
    ++epoch_;
    timer_.stop();
    for (const auto& [id, peer] : peers_) peers.push_back(peer);
  }
  // Joins the worker, so no scheduled task is still running afterwards.
  scheduler_.shutdown();
  outbox_.drain();
  for (auto& peer : peers) peer->close();
  outbox_.shutdown();
  spdlog::info("coordinator stopped");
}

// -- Internals (mtx_ held) ----------------------------------------------------

bool SessionCoordinator::require_question_locked(const char* op, std::string* error) const {
  if (!session_ || !session_->running() || !session_->question_active() || !timer_.active()) {
    spdlog::warn("{} rejected: no active question", op);
    set_error(error, "no active question");
    return false;
  }
  return true;
}

bool SessionCoordinator::advance_locked(const std::string& reason,
                                        bool discard_answers,
                                        std::string* error) {
  if (!session_ || !session_->running()) {
    spdlog::warn("{} rejected: no quiz running", reason);
    set_error(error, "no quiz running");
    return false;
  }
  // Everything that can fail happens before the first mutation.
  const std::string message_id = new_message_id();

  cancel_question_tasks_locked();
  ++epoch_;
  timer_.stop();
  advance_held_ = false;

  if (const Question* current = session_->current_question()) {
    if (discard_answers) {
      registry_.forget_question(current->id);
      spdlog::info("question {} skipped; its answers are dropped from analytics", current->id);
    }
  }

  auto next = session_->next_question();
  if (!next) {
    spdlog::info("{}: no questions left", reason);
    end_quiz_locked();
    return true;
  }
  spdlog::info("{}: sending question {} of {}", reason, session_->current_index() + 1,
               session_->total_questions());
  start_question_locked(*next, message_id);
  return true;
}

void SessionCoordinator::start_question_locked(const Question& question, std::string message_id) {
  tracker_.reset(question.id, message_id);
  broadcast_locked(make_message(MessageType::Question, std::move(message_id),
                                question_payload(view_of(question))));

  timer_.start(question.time_limit, SteadyClock::now());
  const std::uint64_t epoch = epoch_;
  tick_task_ = scheduler_.schedule_every(std::chrono::milliseconds(0), config_.tick_interval,
                                         [this, epoch] { on_tick(epoch); });
  arm_timeout_locked(question.time_limit);

  if (observer_) {
    observer_->on_question_broadcast(question, session_->current_index() + 1,
                                     static_cast<int>(session_->total_questions()));
  }
}

void SessionCoordinator::end_quiz_locked() {
  cancel_question_tasks_locked();
  ++epoch_;
  timer_.stop();
  tracker_.clear();
  advance_held_ = false;
  session_->end();

  auto board = registry_.leaderboard();
  broadcast_locked(make_message(MessageType::QuizEnd, leaderboard_payload(to_rows(board))));
  if (observer_) observer_->on_quiz_ended(board);
  spdlog::info("quiz {} ended\n{}\n{}", session_->id(), registry_.results_summary(),
               registry_.analytics_report());
}

void SessionCoordinator::cancel_question_tasks_locked() {
  for (TaskId* task : {&tick_task_, &advance_task_, &timeout_task_}) {
    if (*task != 0) scheduler_.cancel(*task);
    *task = 0;
  }
  ++advance_gen_;
  ++timeout_gen_;
}

void SessionCoordinator::arm_timeout_locked(int remaining_seconds) {
  if (timeout_task_ != 0) scheduler_.cancel(timeout_task_);
  const std::uint64_t generation = ++timeout_gen_;
  const auto delay = std::chrono::milliseconds(std::max(0, remaining_seconds) * 1000LL) +
                     config_.timeout_buffer;
  timeout_task_ =
      scheduler_.schedule_after(delay, [this, generation] { on_timeout_due(generation); });
}

void SessionCoordinator::arm_advance_locked() {
  if (advance_task_ != 0) scheduler_.cancel(advance_task_);
  const std::uint64_t generation = ++advance_gen_;
  advance_task_ = scheduler_.schedule_after(
      config_.advance_delay, [this, generation] { on_advance_due(generation, "auto-advance"); });
}

void SessionCoordinator::maybe_arm_advance_locked() {
  if (!session_ || !session_->question_active()) return;
  if (!tracker_.should_arm(answered_present_locked(), registry_.count())) return;
  tracker_.mark_armed();
  if (timer_.paused()) {
    advance_held_ = true;
    return;
  }
  arm_advance_locked();
}

std::size_t SessionCoordinator::answered_present_locked() const {
  return static_cast<std::size_t>(
      std::count_if(tracker_.answered().begin(), tracker_.answered().end(),
                    [this](const std::string& id) { return registry_.contains(id); }));
}

void SessionCoordinator::on_tick(std::uint64_t epoch) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (shut_down_ || epoch != epoch_ || !timer_.active()) return;
  const int remaining = timer_.remaining(SteadyClock::now());
  const TimerLabel label = label_for(remaining);
  broadcast_locked(
      make_message(MessageType::TimerSync, timer_sync_payload({remaining, to_string(label)})));
  if (observer_) {
    observer_->on_timer_tick(remaining, label, answered_present_locked(), registry_.count());
  }
}

void SessionCoordinator::on_advance_due(std::uint64_t generation, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (shut_down_ || generation != advance_gen_) return;
  if (!session_ || !session_->running()) return;
  advance_task_ = 0;
  advance_locked(reason, false, nullptr);
}

void SessionCoordinator::on_timeout_due(std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (shut_down_ || generation != timeout_gen_) return;
  if (!session_ || !session_->running() || timer_.paused()) return;
  timeout_task_ = 0;
  advance_locked("time limit reached", false, nullptr);
}

void SessionCoordinator::broadcast_locked(const WireMessage& msg) {
  std::vector<std::shared_ptr<Peer>> targets;
  targets.reserve(peers_.size());
  for (const auto& [id, peer] : peers_) {
    if (peer->alive()) targets.push_back(peer);
  }
  outbox_.post(std::move(targets), encode(msg));
}

void SessionCoordinator::send_locked(ConnectionId connection, const WireMessage& msg) {
  auto it = peers_.find(connection);
  if (it == peers_.end()) return;
  outbox_.post(it->second, encode(msg));
}

void SessionCoordinator::send_result_locked(const std::string& participant_id,
                                            const AnswerResult& result) {
  auto connection = registry_.connection_for(participant_id);
  if (!connection) return;
  send_locked(*connection,
              make_message(MessageType::Result,
                           result_payload({result.correct, result.points_earned, result.message,
                                           result.total_score})));
}

void SessionCoordinator::broadcast_leaderboard_locked() {
  auto board = registry_.leaderboard();
  broadcast_locked(make_message(MessageType::Leaderboard, leaderboard_payload(to_rows(board))));
  if (observer_) observer_->on_leaderboard_update(board);
}

void SessionCoordinator::broadcast_roster_locked() {
  broadcast_locked(make_message(MessageType::Message,
                                "Students online: " + std::to_string(registry_.count())));
}

}  // namespace livequiz::server
