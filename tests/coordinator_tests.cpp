#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/codec.hpp"
#include "common/payloads.hpp"
#include "server/coordinator.hpp"
#include "server/question_bank.hpp"
#include "test_runner.hpp"

using livequiz::MessageType;
using livequiz::WireMessage;
using livequiz::server::AdvancePolicy;
using livequiz::server::ConnectionId;
using livequiz::server::CoordinatorConfig;
using livequiz::server::Question;
using livequiz::server::QuestionBank;
using livequiz::server::SessionCoordinator;
using livequiz::test::TestRunner;
using livequiz::test::eventually;
using std::chrono::milliseconds;

namespace {

class FakePeer : public livequiz::server::Peer {
 public:
  explicit FakePeer(ConnectionId id) : id_(id) {}

  ConnectionId id() const override { return id_; }
  std::string describe() const override { return "fake-" + std::to_string(id_); }

  bool send_line(const std::string& line) override {
    if (fail_.load() || !alive_.load()) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    lines_.push_back(line);
    return true;
  }

  void close() override { alive_.store(false); }
  bool alive() const override { return alive_.load(); }

  void fail_sends() { fail_.store(true); }

  std::vector<WireMessage> received(const std::string& type = {}) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<WireMessage> out;
    for (const auto& line : lines_) {
      std::string err;
      auto msg = livequiz::decode(line, err);
      if (msg && (type.empty() || msg->type == type)) out.push_back(*msg);
    }
    return out;
  }

  std::size_t count(const std::string& type) const { return received(type).size(); }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    lines_.clear();
  }

 private:
  ConnectionId id_;
  std::atomic<bool> alive_{true};
  std::atomic<bool> fail_{false};
  mutable std::mutex mtx_;
  std::vector<std::string> lines_;
};

class RecordingObserver : public livequiz::server::SessionObserver {
 public:
  void on_quiz_started(const std::string&, std::size_t) override { ++started; }
  void on_question_broadcast(const Question&, int, int) override { ++questions; }
  void on_timer_tick(int, livequiz::server::TimerLabel, std::size_t, std::size_t) override {
    ++ticks;
  }
  void on_answer_recorded(const std::string&, const livequiz::server::AnswerResult&) override {
    ++answers;
  }
  void on_quiz_ended(const std::vector<livequiz::server::LeaderboardEntry>&) override { ++ended; }

  std::atomic<int> started{0};
  std::atomic<int> questions{0};
  std::atomic<int> ticks{0};
  std::atomic<int> answers{0};
  std::atomic<int> ended{0};
};

// Stalls inside the coordinator lock so a scheduled task comes due while a
// later operation is still running.
class StallingObserver : public livequiz::server::SessionObserver {
 public:
  StallingObserver(std::string participant, std::string action, milliseconds stall)
      : participant_(std::move(participant)), action_(std::move(action)), stall_(stall) {}

  void on_answer_recorded(const std::string& participant_id,
                          const livequiz::server::AnswerResult&) override {
    if (participant_id == participant_) std::this_thread::sleep_for(stall_);
  }
  void on_timer_control(const std::string& action, int) override {
    if (action == action_) std::this_thread::sleep_for(stall_);
  }

 private:
  std::string participant_;
  std::string action_;
  milliseconds stall_;
};

CoordinatorConfig fast_config(AdvancePolicy policy = AdvancePolicy::WaitForAll) {
  CoordinatorConfig cfg;
  cfg.advance_policy = policy;
  cfg.start_delay = milliseconds(10);
  cfg.advance_delay = milliseconds(60);
  cfg.timeout_buffer = milliseconds(50);
  cfg.tick_interval = milliseconds(20);
  return cfg;
}

std::vector<Question> questions(int count, int time_limit = 30) {
  QuestionBank bank;
  for (int i = 0; i < count; ++i) {
    bank.add("Question " + std::to_string(i + 1), {"a", "b", "c", "d"}, i % 4, time_limit, 10);
  }
  return bank.all();
}

std::shared_ptr<FakePeer> connect(SessionCoordinator& c, ConnectionId id,
                                  const std::string& participant, const std::string& name) {
  auto peer = std::make_shared<FakePeer>(id);
  c.accept_connection(peer);
  c.join(id, participant, name);
  return peer;
}

// Question currently on screen, as the coordinator reports it (1-based).
int question_number(const SessionCoordinator& c) {
  return c.status().question_number;
}

int current_question_id(const FakePeer& peer) {
  auto qs = peer.received("QUESTION");
  if (qs.empty()) return -1;
  std::string err;
  auto view = livequiz::parse_question(qs.back().payload, err);
  return view ? view->id : -1;
}

}  // namespace

int main() {
  TestRunner tr("coordinator");

  // Joining.
  {
    SessionCoordinator c(fast_config());
    auto alice = connect(c, 1, "S1", "Alice");
    auto impostor = std::make_shared<FakePeer>(2);
    c.accept_connection(impostor);
    std::string err;
    tr.expect(!c.join(2, "S1", "Impostor", &err), "duplicate participant id rejected");
    tr.expect(!c.join(99, "S9", "Ghost", &err), "join from an unknown connection rejected");
    c.flush();

    auto acks = alice->received("ACK");
    tr.expect(acks.size() == 1 && acks[0].payload == "Welcome Alice!", "welcome ack");
    tr.expect(impostor->count("ERROR") == 1, "rejected join gets an error");
    bool announced = false;
    for (const auto& m : impostor->received("MESSAGE")) {
      announced = announced || m.payload == "[JOIN] Alice joined";
    }
    tr.expect(!announced, "late connections do not see earlier joins");
    tr.expect(c.status().participants == 1 && c.connection_count() == 2, "roster counts");
  }

  // Admin misuse is rejected without state change.
  {
    SessionCoordinator c(fast_config());
    std::string err;
    tr.expect(!c.start_quiz({}, &err) && !err.empty(), "empty quiz rejected");
    tr.expect(!c.send_next_question(&err), "next without a quiz rejected");
    tr.expect(!c.pause(&err) && !c.resume(&err) && !c.skip(&err) && !c.force_next(&err),
              "timer controls need a running quiz");
    tr.expect(!c.extend(10, &err), "extend needs an active question");
    tr.expect(!c.end_quiz(), "end without a quiz is a no-op");
    tr.expect(c.status().label == "idle", "still idle");

    auto peer = connect(c, 1, "S1", "Alice");
    auto r = c.record_answer("S1", 1, 0, 100);
    tr.expect(!r.accepted && r.message == "No active question", "answer before start rejected");
  }

  // Quiz start, question broadcast and answer validation.
  {
    SessionCoordinator c(fast_config());
    auto alice = connect(c, 1, "S1", "Alice");
    auto bob = connect(c, 2, "S2", "Bob");
    std::string err;
    tr.expect(c.start_quiz(questions(2), &err), "start quiz");
    tr.expect(!c.start_quiz(questions(2), &err) && err == "quiz already in progress",
              "second start rejected");
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question after delay");
    c.flush();

    auto starts = alice->received("QUIZ_START");
    tr.expect(starts.size() == 1 && starts[0].payload == "2", "quiz start carries the count");
    auto qs = alice->received("QUESTION");
    tr.expect(qs.size() == 1 && qs[0].id && qs[0].id->rfind("M-", 0) == 0,
              "question carries a message id");
    const int qid = current_question_id(*alice);

    c.acknowledge(1, *qs[0].id);
    c.acknowledge(2, "M-unrelated");
    tr.expect(c.status().acknowledged == 1, "acks counted per question");

    auto stale = c.record_answer("S1", qid + 100, 0, 500);
    tr.expect(!stale.accepted && stale.message == "Invalid question", "stale question rejected");
    auto ghost = c.record_answer("S9", qid, 0, 500);
    tr.expect(!ghost.accepted && ghost.message == "Participant not found",
              "unknown participant rejected");
    auto bad = c.record_answer("S1", qid, 7, 500);
    tr.expect(!bad.accepted && bad.message == "Invalid option", "option out of range rejected");

    // Question 1 has correct option 0.
    auto ok = c.record_answer("S1", qid, 0, 1000);
    tr.expect(ok.accepted && ok.correct && ok.points_earned == 15, "fast correct answer scored");
    tr.expect(ok.message == "Correct! +15 points", "result message");
    auto dup = c.record_answer("S1", qid, 0, 1200);
    tr.expect(!dup.accepted && dup.message == "Already answered", "duplicate rejected");
    tr.expect(c.leaderboard()[0].score == 15, "duplicate never double-scores");

    auto wrong = c.submit_answer(2, qid, 3, 2000);
    tr.expect(wrong.accepted && !wrong.correct && wrong.message == "Incorrect", "wrong answer");
    c.flush();

    auto results = alice->received("RESULT");
    tr.expect(results.size() == 4, "result sent for every answer from the participant");
    tr.expect(alice->count("LEADERBOARD") >= 2, "leaderboard broadcast after answers");
    tr.expect(bob->count("RESULT") == 1, "results go only to the answering participant");
    tr.expect(c.history("S1").size() == 1, "one history entry");
  }

  // Wait-for-all advances once everyone answered.
  {
    SessionCoordinator c(fast_config(AdvancePolicy::WaitForAll));
    auto alice = connect(c, 1, "S1", "Alice");
    auto bob = connect(c, 2, "S2", "Bob");
    c.start_quiz(questions(3));
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question");
    c.flush();
    const int qid = current_question_id(*alice);

    c.record_answer("S1", qid, 0, 800);
    std::this_thread::sleep_for(milliseconds(150));
    tr.expect(question_number(c) == 1, "one answer is not enough");
    c.record_answer("S2", qid, 1, 900);
    tr.expect(eventually([&] { return question_number(c) == 2; }), "advances after all answered");
  }

  // A silent participant is covered by the question timeout.
  {
    SessionCoordinator c(fast_config(AdvancePolicy::WaitForAll));
    auto alice = connect(c, 1, "S1", "Alice");
    auto bob = connect(c, 2, "S2", "Bob");
    c.start_quiz(questions(2, 1));
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question");
    c.flush();
    c.record_answer("S1", current_question_id(*alice), 0, 300);
    tr.expect(eventually([&] { return question_number(c) == 2; }, milliseconds(3000)),
              "timeout advances past a silent participant");
    tr.expect(eventually([&] { return c.status().label == "ended"; }, milliseconds(3000)),
              "last timeout ends the quiz");
    c.flush();
    tr.expect(alice->count("QUIZ_END") == 1, "quiz end broadcast once");
    tr.expect(alice->count("TIMER_SYNC") >= 1, "ticks were broadcast");
    int bob_answered = -1;
    int alice_answered = -1;
    for (const auto& e : c.leaderboard()) {
      if (e.participant_id == "S2") bob_answered = e.answered;
      if (e.participant_id == "S1") alice_answered = e.answered;
    }
    tr.expect(bob_answered == 0, "silent participant has no answers");
    tr.expect(alice_answered == 1, "answering participant counted once");
  }

  // Skipping cancels a pending auto-advance.
  {
    CoordinatorConfig cfg = fast_config(AdvancePolicy::DelayAfterAnswer);
    cfg.advance_delay = milliseconds(250);
    SessionCoordinator c(cfg);
    auto alice = connect(c, 1, "S1", "Alice");
    c.start_quiz(questions(3));
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question");
    c.flush();
    const int first_qid = current_question_id(*alice);
    c.record_answer("S1", first_qid, 0, 500);

    std::string err;
    tr.expect(c.skip(&err), "skip");
    tr.expect(question_number(c) == 2, "skip moves on immediately");
    c.flush();
    const int second_qid = current_question_id(*alice);
    tr.expect(alice->count("QUESTION") == 2 && second_qid != first_qid &&
                  second_qid == questions(3)[1].id,
              "skip broadcasts the following question");
    std::this_thread::sleep_for(milliseconds(400));
    tr.expect(question_number(c) == 2, "stale auto-advance did not fire");

    bool first_in_analytics = false;
    for (const auto& a : c.analytics()) first_in_analytics |= a.question_id == first_qid;
    tr.expect(!first_in_analytics, "skipped question left out of analytics");
    tr.expect(c.leaderboard()[0].score > 0, "skip keeps scores");

    tr.expect(c.force_next(&err) && question_number(c) == 3, "force next");
  }

  // Pause holds the timer and the auto-advance; resume and extend re-arm them.
  {
    CoordinatorConfig cfg = fast_config(AdvancePolicy::DelayAfterAnswer);
    cfg.advance_delay = milliseconds(150);
    SessionCoordinator c(cfg);
    auto alice = connect(c, 1, "S1", "Alice");
    c.start_quiz(questions(2));
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question");
    c.flush();
    c.record_answer("S1", current_question_id(*alice), 0, 400);

    std::string err;
    tr.expect(c.pause(&err), "pause");
    tr.expect(!c.pause(&err), "double pause rejected");
    tr.expect(c.status().label == "paused", "status shows paused");
    std::this_thread::sleep_for(milliseconds(300));
    tr.expect(question_number(c) == 1, "auto-advance held while paused");

    tr.expect(!c.extend(0, &err), "zero extension rejected");
    tr.expect(c.extend(15, &err), "extend while paused");
    tr.expect(c.status().remaining == 45, "extension added to the frozen time");
    tr.expect(c.resume(&err), "resume");
    tr.expect(!c.resume(&err), "resume without pause rejected");
    tr.expect(eventually([&] { return question_number(c) == 2; }), "held advance fires on resume");
    c.flush();

    std::vector<std::string> actions;
    for (const auto& m : alice->received("TIMER_CONTROL")) {
      std::string perr;
      auto control = livequiz::parse_timer_control(m.payload, perr);
      if (control) actions.push_back(control->action);
    }
    tr.expect(actions == std::vector<std::string>({"pause", "extend", "resume"}),
              "controls broadcast in order");
  }

  // An advance already due while the lock is held is superseded by the re-arm.
  {
    CoordinatorConfig cfg = fast_config(AdvancePolicy::DelayAfterAnswer);
    cfg.advance_delay = milliseconds(200);
    StallingObserver observer("S2", "", milliseconds(300));
    SessionCoordinator c(cfg);
    c.set_observer(&observer);
    auto alice = connect(c, 1, "S1", "Alice");
    auto bob = connect(c, 2, "S2", "Bob");
    c.start_quiz(questions(2));
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question");
    c.flush();
    const int qid = current_question_id(*alice);

    c.record_answer("S1", qid, 0, 300);
    std::this_thread::sleep_for(milliseconds(50));
    c.record_answer("S2", qid, 1, 400);
    std::this_thread::sleep_for(milliseconds(100));
    tr.expect(question_number(c) == 1, "superseded advance does not fire");
    tr.expect(eventually([&] { return question_number(c) == 2; }),
              "re-armed advance fires after the full delay");
  }

  // An advance already due when pause takes the lock stays held.
  {
    CoordinatorConfig cfg = fast_config(AdvancePolicy::DelayAfterAnswer);
    cfg.advance_delay = milliseconds(200);
    StallingObserver observer("", "pause", milliseconds(300));
    SessionCoordinator c(cfg);
    c.set_observer(&observer);
    auto alice = connect(c, 1, "S1", "Alice");
    c.start_quiz(questions(2));
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question");
    c.flush();
    c.record_answer("S1", current_question_id(*alice), 0, 300);
    std::this_thread::sleep_for(milliseconds(100));

    std::string err;
    tr.expect(c.pause(&err), "pause while the advance comes due");
    std::this_thread::sleep_for(milliseconds(200));
    tr.expect(question_number(c) == 1 && c.status().label == "paused",
              "no advance while paused");
    tr.expect(c.resume(&err), "resume");
    tr.expect(eventually([&] { return question_number(c) == 2; }), "held advance fires on resume");
  }

  // Reported latency is capped at the time the question was open.
  {
    SessionCoordinator c(fast_config(),
                         std::make_unique<livequiz::server::TimeFractionPolicy>());
    auto alice = connect(c, 1, "S1", "Alice");
    c.start_quiz(questions(2));
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question");
    c.flush();
    auto r = c.record_answer("S1", current_question_id(*alice), 0, 4000000000000000000);
    tr.expect(r.accepted && r.points_earned == 10, "huge latency earns the plain points");
    auto h = c.history("S1");
    tr.expect(h.size() == 1 && h[0].latency_ms == 30 * 1000 + 50, "latency clamped");
  }

  // A dead peer is dropped without disturbing the others.
  {
    SessionCoordinator c(fast_config());
    auto alice = connect(c, 1, "S1", "Alice");
    auto bob = connect(c, 2, "S2", "Bob");
    c.flush();
    bob->fail_sends();
    c.announce("hello everyone");
    c.flush();
    tr.expect(eventually([&] { return c.connection_count() == 1; }), "dead peer removed");
    tr.expect(!bob->alive(), "dead peer closed");
    c.announce("still here");
    c.flush();
    int host_lines = 0;
    for (const auto& m : alice->received("MESSAGE")) {
      if (m.payload.rfind("[HOST]", 0) == 0) ++host_lines;
    }
    tr.expect(host_lines == 2, "remaining peer got every announcement");
    tr.expect(c.status().participants == 1, "dead participant left the roster");
  }

  // A departure can complete wait-for-all.
  {
    SessionCoordinator c(fast_config(AdvancePolicy::WaitForAll));
    auto alice = connect(c, 1, "S1", "Alice");
    auto bob = connect(c, 2, "S2", "Bob");
    c.start_quiz(questions(2));
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question");
    c.flush();
    c.record_answer("S1", current_question_id(*alice), 0, 300);
    c.remove_connection(2);
    tr.expect(eventually([&] { return question_number(c) == 2; }),
              "advance once the remaining participants answered");
    c.remove_connection(2);
    tr.expect(c.status().participants == 1, "removal is idempotent");
  }

  // Late joiners catch up with the running question.
  {
    SessionCoordinator c(fast_config());
    auto alice = connect(c, 1, "S1", "Alice");
    c.start_quiz(questions(2));
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question");
    auto carol = connect(c, 3, "S3", "Carol");
    c.flush();
    tr.expect(carol->count("QUIZ_START") == 1, "late joiner gets the quiz start");
    auto qs = carol->received("QUESTION");
    tr.expect(qs.size() == 1 && qs[0].id == alice->received("QUESTION").back().id,
              "late joiner gets the current question with its id");
    tr.expect(carol->count("TIMER_SYNC") >= 1, "late joiner gets the countdown");
  }

  // Ending is idempotent and emits one final leaderboard.
  {
    RecordingObserver observer;
    SessionCoordinator c(fast_config());
    c.set_observer(&observer);
    auto alice = connect(c, 1, "S1", "Alice");
    c.start_quiz(questions(3));
    tr.expect(eventually([&] { return question_number(c) == 1; }), "first question");
    c.flush();
    c.record_answer("S1", current_question_id(*alice), 0, 1000);
    tr.expect(c.end_quiz(), "end");
    tr.expect(!c.end_quiz(), "second end is a no-op");
    c.flush();
    auto ends = alice->received("QUIZ_END");
    tr.expect(ends.size() == 1, "exactly one quiz end");
    std::string err;
    auto rows = ends.empty() ? std::nullopt : livequiz::parse_leaderboard(ends[0].payload, err);
    tr.expect(rows && rows->size() == 1 && (*rows)[0].name == "Alice" && (*rows)[0].score == 15,
              "final leaderboard in quiz end");
    tr.expect(c.status().label == "ended", "status ended");
    tr.expect(c.results_summary().find("Alice") != std::string::npos, "results summary");

    std::this_thread::sleep_for(milliseconds(100));
    tr.expect(question_number(c) == 0, "no question after the end");
    tr.expect(observer.started == 1 && observer.questions == 1 && observer.answers == 1 &&
                  observer.ended == 1,
              "observer saw the session");
    c.set_observer(nullptr);

    tr.expect(c.start_quiz(questions(1), &err), "a new quiz can start after the end");
    tr.expect(c.leaderboard()[0].score == 0, "new quiz resets scores");
  }

  // Chat relays to everyone; unjoined connections are refused.
  {
    SessionCoordinator c(fast_config());
    auto alice = connect(c, 1, "S1", "Alice");
    auto lurker = std::make_shared<FakePeer>(2);
    c.accept_connection(lurker);
    c.chat(1, "hi\nthere");
    c.chat(2, "let me in");
    c.flush();
    bool relayed = false;
    for (const auto& m : lurker->received("MESSAGE")) relayed |= m.payload == "Alice: hi there";
    tr.expect(relayed, "chat relayed to every connection");
    tr.expect(lurker->count("ERROR") == 1, "chat before join refused");
  }

  // Shutdown stops scheduled work and closes peers.
  {
    SessionCoordinator c(fast_config());
    auto alice = connect(c, 1, "S1", "Alice");
    c.start_quiz(questions(2));
    c.shutdown();
    tr.expect(!alice->alive(), "peers closed");
    tr.expect(c.status().label == "stopped", "status stopped");
    std::string err;
    tr.expect(!c.start_quiz(questions(1), &err), "no quiz after shutdown");
    c.shutdown();
  }

  return tr.exit_code();
}
