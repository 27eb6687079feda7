#include "client/ui.hpp"

#include <cctype>
#include <iomanip>

namespace livequiz::client {

namespace {

const char* timer_colour(const std::string& state) {
  if (state == "critical") return "\033[31m";
  if (state == "warning") return "\033[33m";
  return "\033[32m";
}

constexpr const char* kReset = "\033[0m";

}  // namespace

void render_question(std::ostream& out, const ParticipantState& state) {
  if (!state.question) {
    out << "(waiting for the next question)\n";
    return;
  }
  const auto& q = *state.question;
  out << "\n=== Question " << state.question_number << "/" << state.total_questions << " ("
      << q.points << " pts, " << q.time_limit << "s) ===\n"
      << q.text << "\n";
  for (int i = 0; i < 4; ++i) {
    out << "  " << static_cast<char>('A' + i) << ") " << q.options[i]
        << (state.chosen_option == i ? "  <- your answer" : "") << "\n";
  }
}

void render_leaderboard(std::ostream& out, const ParticipantState& state) {
  if (state.leaderboard.empty()) {
    out << "(leaderboard is empty)\n";
    return;
  }
  out << "--- Leaderboard ---\n";
  for (const auto& row : state.leaderboard) {
    out << std::setw(3) << row.rank << ". " << std::left << std::setw(16) << row.name
        << std::right << std::setw(5) << row.score << " pts  " << row.correct << "/"
        << row.answered << (row.name == state.name ? "  (you)" : "") << "\n";
  }
}

void render_message(std::ostream& out, const ParticipantState& state, const WireMessage& msg) {
  auto type = message_type_from_string(msg.type);
  if (!type) return;
  switch (*type) {
    case MessageType::Ack:
      out << "[server] " << msg.payload << "\n";
      break;
    case MessageType::Error:
      out << "[error] " << msg.payload << "\n";
      break;
    case MessageType::QuizStart:
      out << "\n*** Quiz starting: " << state.total_questions << " questions. Get ready! ***\n";
      break;
    case MessageType::Question:
      render_question(out, state);
      out << "Answer with A, B, C or D.\n";
      break;
    case MessageType::Result:
      if (state.last_result) {
        out << (state.last_result->correct ? "[correct] " : "[result] ")
            << state.last_result->message << " (score " << state.score << ")\n";
      }
      break;
    case MessageType::Leaderboard:
      // Refreshed silently; "/board" prints it.
      break;
    case MessageType::QuizEnd:
      out << "\n*** Quiz over! Final score: " << state.score << " ***\n";
      render_leaderboard(out, state);
      break;
    case MessageType::TimerSync:
      if (state.question && !state.answered &&
          (state.remaining % 10 == 0 || state.timer_state == "critical")) {
        out << timer_colour(state.timer_state) << "[" << state.remaining << "s]" << kReset
            << "\n";
      }
      break;
    case MessageType::TimerControl:
      if (state.paused) {
        out << "[timer] paused at " << state.remaining << "s\n";
      } else {
        out << "[timer] " << state.remaining << "s remaining\n";
      }
      break;
    case MessageType::Message:
      out << "> " << msg.payload << "\n";
      break;
    default:
      break;
  }
}

void render_help(std::ostream& out) {
  out << "Type A-D (or 1-4) to answer, /board for the leaderboard, /status for the\n"
         "current question, /quit to leave. Any other text is sent as chat.\n";
}

ParsedInput parse_input(const std::string& line) {
  ParsedInput in;
  std::size_t start = 0;
  while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start]))) ++start;
  std::size_t end = line.size();
  while (end > start && std::isspace(static_cast<unsigned char>(line[end - 1]))) --end;
  std::string text = line.substr(start, end - start);
  if (text.empty()) return in;

  if (text.size() == 1) {
    char c = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    if (c >= 'A' && c <= 'D') {
      in.kind = InputKind::Answer;
      in.option = c - 'A';
      return in;
    }
    if (c >= '1' && c <= '4') {
      in.kind = InputKind::Answer;
      in.option = c - '1';
      return in;
    }
  }
  if (text == "/board") {
    in.kind = InputKind::Board;
  } else if (text == "/status") {
    in.kind = InputKind::Status;
  } else if (text == "/help") {
    in.kind = InputKind::Help;
  } else if (text == "/quit") {
    in.kind = InputKind::Quit;
  } else {
    in.kind = InputKind::Chat;
    in.text = text;
  }
  return in;
}

}  // namespace livequiz::client
