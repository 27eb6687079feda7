#include <chrono>
#include <string>

#include "client/state.hpp"
#include "client/ui.hpp"
#include "common/codec.hpp"
#include "common/payloads.hpp"
#include "test_runner.hpp"

using livequiz::MessageType;
using livequiz::client::InputKind;
using livequiz::client::ParticipantState;
using livequiz::client::apply_message;
using livequiz::client::make_answer;
using livequiz::client::parse_input;
using livequiz::make_message;
using livequiz::test::TestRunner;

namespace {

livequiz::WireMessage question(int id, const std::string& msg_id) {
  livequiz::QuestionView view;
  view.id = id;
  view.text = "Q" + std::to_string(id);
  view.time_limit = 30;
  view.points = 10;
  view.options = {"a", "b", "c", "d"};
  return make_message(MessageType::Question, msg_id, livequiz::question_payload(view));
}

}  // namespace

int main() {
  TestRunner tr("client");

  // Questions are acknowledged and answered once.
  {
    ParticipantState s;
    s.participant_id = "S1";
    s.name = "Alice";
    std::string err;
    apply_message(s, make_message(MessageType::Ack, "Welcome Alice!"), err);
    tr.expect(s.joined && s.messages.back() == "Welcome Alice!", "welcome marks joined");
    apply_message(s, make_message(MessageType::QuizStart, "3"), err);
    tr.expect(s.quiz_running && s.total_questions == 3, "quiz start");

    auto replies = apply_message(s, question(7, "M-1"), err);
    tr.expect(replies.size() == 1 && replies[0].type == "ACK" && replies[0].id == "M-1" &&
                  replies[0].payload == "OK",
              "question acknowledged with its id");
    tr.expect(s.question_number == 1 && s.question && s.question->id == 7, "question shown");

    auto shown = s.question_shown_at;
    auto answer = make_answer(s, 2, shown + std::chrono::milliseconds(1500), err);
    std::string perr;
    auto parsed = answer ? livequiz::parse_answer(answer->payload, perr) : std::nullopt;
    tr.expect(parsed && parsed->question_id == 7 && parsed->option == 2 &&
                  parsed->latency_ms == 1500,
              "answer carries measured latency");
    tr.expect(!make_answer(s, 1, shown, err) && err == "already answered",
              "second answer refused locally");

    apply_message(s, question(7, "M-1"), err);
    tr.expect(s.answered && s.question_number == 1, "repeat of the same question keeps state");

    apply_message(s, question(8, "M-2"), err);
    tr.expect(!s.answered && s.question_number == 2, "new question clears the answer flag");
    tr.expect(!make_answer(s, 4, shown, err), "option out of range refused");
  }

  // Timer and result updates.
  {
    ParticipantState s;
    std::string err;
    apply_message(s, question(1, "M-1"), err);
    apply_message(s, make_message(MessageType::TimerSync, "9~critical"), err);
    tr.expect(s.remaining == 9 && s.timer_state == "critical", "timer sync");
    apply_message(s, make_message(MessageType::TimerControl, "pause~9"), err);
    tr.expect(s.paused, "paused");
    apply_message(s, make_message(MessageType::TimerControl, "extend~15"), err);
    tr.expect(s.remaining == 24, "extension added");
    apply_message(s, make_message(MessageType::TimerControl, "resume~24"), err);
    tr.expect(!s.paused && s.remaining == 24, "resumed");

    apply_message(s, make_message(MessageType::Result, "1~15~Correct! +15 points~15"), err);
    tr.expect(s.score == 15 && s.last_result && s.last_result->correct, "result applied");

    apply_message(s, make_message(MessageType::QuizEnd, "1~Alice~15~1~1"), err);
    tr.expect(s.quiz_over && !s.question && s.leaderboard.size() == 1, "quiz end");
    tr.expect(!make_answer(s, 0, std::chrono::steady_clock::now(), err),
              "no answers after the end");
  }

  // Bad input leaves the state alone.
  {
    ParticipantState s;
    std::string err;
    apply_message(s, make_message(MessageType::QuizStart, "many"), err);
    tr.expect(!s.quiz_running && !err.empty(), "bad count rejected");
    err.clear();
    apply_message(s, {"BOGUS", std::nullopt, "x"}, err);
    tr.expect(!err.empty(), "unknown type reported");
    for (int i = 0; i < 60; ++i) {
      apply_message(s, make_message(MessageType::Message, "line " + std::to_string(i)), err);
    }
    tr.expect(s.messages.size() == livequiz::client::kMaxChatLines &&
                  s.messages.back() == "line 59",
              "chat history bounded");
  }

  // Console input.
  {
    tr.expect(parse_input("b").kind == InputKind::Answer && parse_input("b").option == 1,
              "letter answer");
    tr.expect(parse_input(" 4 ").option == 3, "digit answer");
    tr.expect(parse_input("/board").kind == InputKind::Board, "board command");
    tr.expect(parse_input("/quit").kind == InputKind::Quit, "quit command");
    auto chat = parse_input("e is not an option");
    tr.expect(chat.kind == InputKind::Chat && chat.text == "e is not an option", "chat");
    tr.expect(parse_input("   ").kind == InputKind::Empty, "blank line");
  }

  return tr.exit_code();
}
