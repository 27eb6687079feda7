#include "client/state.hpp"

namespace livequiz::client {

namespace {

void push_line(ParticipantState& state, std::string line) {
  state.messages.push_back(std::move(line));
  while (state.messages.size() > kMaxChatLines) state.messages.pop_front();
}

}  // namespace

std::vector<WireMessage> apply_message(ParticipantState& state, const WireMessage& msg,
                                       std::string& error) {
  std::vector<WireMessage> replies;
  auto type = message_type_from_string(msg.type);
  if (!type) {
    error = "unknown message type " + msg.type;
    return replies;
  }

  switch (*type) {
    case MessageType::Ack:
      state.joined = true;
      state.last_error.clear();
      push_line(state, msg.payload);
      break;
    case MessageType::Error:
      state.last_error = msg.payload;
      break;
    case MessageType::QuizStart: {
      auto count = parse_int(msg.payload);
      if (!count) {
        error = "bad question count: " + msg.payload;
        break;
      }
      state.quiz_running = true;
      state.quiz_over = false;
      state.total_questions = *count;
      state.question_number = 0;
      state.question.reset();
      state.last_result.reset();
      state.score = 0;
      state.paused = false;
      break;
    }
    case MessageType::Question: {
      auto q = parse_question(msg.payload, error);
      if (!q) break;
      // A repeat of the question on screen (late join) keeps the answer flag.
      const bool same = state.question && state.question->id == q->id;
      if (!same) {
        ++state.question_number;
        state.answered = false;
        state.chosen_option = -1;
        state.question_shown_at = std::chrono::steady_clock::now();
      }
      state.question = *q;
      state.remaining = q->time_limit;
      state.timer_state = "normal";
      state.paused = false;
      if (msg.id) replies.push_back(make_message(MessageType::Ack, *msg.id, "OK"));
      break;
    }
    case MessageType::Result: {
      auto r = parse_result(msg.payload, error);
      if (!r) break;
      state.last_result = *r;
      state.score = r->total_score;
      break;
    }
    case MessageType::Leaderboard: {
      auto rows = parse_leaderboard(msg.payload, error);
      if (rows) state.leaderboard = std::move(*rows);
      break;
    }
    case MessageType::QuizEnd: {
      auto rows = parse_leaderboard(msg.payload, error);
      if (rows) state.leaderboard = std::move(*rows);
      state.quiz_running = false;
      state.quiz_over = true;
      state.question.reset();
      break;
    }
    case MessageType::TimerSync: {
      auto sync = parse_timer_sync(msg.payload, error);
      if (!sync) break;
      state.remaining = sync->remaining;
      state.timer_state = sync->state;
      break;
    }
    case MessageType::TimerControl: {
      auto control = parse_timer_control(msg.payload, error);
      if (!control) break;
      if (control->action == "pause") {
        state.paused = true;
        state.remaining = control->value;
      } else if (control->action == "resume") {
        state.paused = false;
        state.remaining = control->value;
      } else {
        state.remaining += control->value;
      }
      break;
    }
    case MessageType::Message:
      push_line(state, msg.payload);
      break;
    default:
      error = "unexpected " + msg.type + " from server";
      break;
  }
  return replies;
}

std::optional<WireMessage> make_answer(ParticipantState& state, int option,
                                       std::chrono::steady_clock::time_point now,
                                       std::string& error) {
  if (!state.question) {
    error = "no question on screen";
    return std::nullopt;
  }
  if (state.answered) {
    error = "already answered";
    return std::nullopt;
  }
  if (option < 0 || option > 3) {
    error = "choose A, B, C or D";
    return std::nullopt;
  }
  auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                     now - state.question_shown_at)
                     .count();
  if (latency < 0) latency = 0;
  state.answered = true;
  state.chosen_option = option;
  return make_message(MessageType::Answer,
                      answer_payload({state.question->id, option, latency}));
}

WireMessage make_join(const ParticipantState& state) {
  return make_message(MessageType::StudentJoin,
                      join_payload({state.participant_id, state.name}));
}

}  // namespace livequiz::client
