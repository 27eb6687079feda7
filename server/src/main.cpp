#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/codec.hpp"
#include "common/payloads.hpp"
#include "server/config.hpp"
#include "server/coordinator.hpp"
#include "server/question_bank.hpp"
#include "server/server.hpp"

using livequiz::server::CoordinatorStatus;
using livequiz::server::LeaderboardEntry;
using livequiz::server::Question;
using livequiz::server::QuestionBank;
using livequiz::server::Server;
using livequiz::server::ServerConfig;
using livequiz::server::SessionCoordinator;
using livequiz::server::TimerLabel;

namespace {
std::atomic<bool> g_stop{false};

void signal_handler(int) {
  g_stop.store(true);
}

bool load_questions(const ServerConfig& config, QuestionBank& bank) {
  std::string error;
  if (!config.questions_db.empty()) {
    int n = bank.load_sqlite(config.questions_db, &error);
    if (n < 0) {
      spdlog::error("cannot load questions from {}: {}", config.questions_db, error);
      return false;
    }
    spdlog::info("loaded {} questions from {}", n, config.questions_db);
  } else if (!config.questions_file.empty()) {
    int n = bank.load_json(config.questions_file, &error);
    if (n < 0) {
      spdlog::error("cannot load questions from {}: {}", config.questions_file, error);
      return false;
    }
    spdlog::info("loaded {} questions from {}", n, config.questions_file);
  } else {
    spdlog::info("loaded {} built-in questions", bank.load_defaults());
  }
  if (bank.size() == 0) {
    spdlog::error("question source is empty");
    return false;
  }
  return true;
}

void print_board(const std::vector<LeaderboardEntry>& board) {
  if (board.empty()) {
    std::cout << "  (no participants)\n";
    return;
  }
  for (const auto& e : board) {
    std::cout << "  " << std::setw(2) << e.rank << ". " << std::left << std::setw(16) << e.name
              << std::right << std::setw(5) << e.score << " pts  " << e.correct << "/"
              << e.answered << " correct\n";
  }
}

// Console view of the session. Runs under the coordinator lock, so it only
// prints.
class ConsoleObserver : public livequiz::server::SessionObserver {
 public:
  void on_quiz_started(const std::string& session_id, std::size_t questions) override {
    std::cout << "[QUIZ] " << session_id << " started with " << questions << " questions\n";
  }

  void on_question_broadcast(const Question& q, int index, int total) override {
    last_label_ = TimerLabel::Normal;
    std::cout << "[QUESTION " << index << "/" << total << "] " << q.text << " (" << q.time_limit
              << "s, " << q.points << " pts, answer " << static_cast<char>('A' + q.correct_index)
              << ")\n";
  }

  void on_timer_tick(int remaining, TimerLabel label, std::size_t answered,
                     std::size_t participants) override {
    if (label == last_label_ && remaining != 0) return;
    last_label_ = label;
    std::cout << "[TIMER] " << remaining << "s left (" << livequiz::server::to_string(label)
              << "), " << answered << "/" << participants << " answered\n";
  }

  void on_timer_control(const std::string& action, int value) override {
    std::cout << "[TIMER] " << action << " " << value << "\n";
  }

  void on_answer_recorded(const std::string& participant_id,
                          const livequiz::server::AnswerResult& result) override {
    std::cout << "[ANSWER] " << participant_id << ": " << result.message << " (total "
              << result.total_score << ")\n";
  }

  void on_participants_changed(std::size_t count) override {
    std::cout << "[ROSTER] " << count << " participant(s) online\n";
  }

  void on_quiz_ended(const std::vector<LeaderboardEntry>& board) override {
    std::cout << "[QUIZ] finished. Final leaderboard:\n";
    print_board(board);
  }

 private:
  TimerLabel last_label_{TimerLabel::Normal};
};

void print_status(const CoordinatorStatus& s) {
  std::cout << "  state:        " << s.label << "\n";
  if (!s.session_id.empty()) {
    std::cout << "  session:      " << s.session_id << "\n"
              << "  question:     " << s.question_number << "/" << s.total_questions << "\n"
              << "  remaining:    " << s.remaining << "s ("
              << livequiz::server::to_string(s.timer_label) << ")\n"
              << "  answered:     " << s.answered << " (acks " << s.acknowledged << ")\n";
  }
  std::cout << "  participants: " << s.participants << " (" << s.connections
            << " connections)\n"
            << "  policies:     " << s.scoring_policy << " scoring, "
            << livequiz::server::to_string(s.advance_policy) << "\n";
}

void print_help() {
  std::cout << "commands: status | start [n] | next | skip | force | pause | resume |\n"
               "          extend <s> | end | board | results | analytics | questions |\n"
               "          say <text> | quit\n";
}

void report(bool ok, const std::string& what, const std::string& error) {
  if (ok) {
    std::cout << "  ok: " << what << "\n";
  } else {
    std::cout << "  " << what << " failed: " << error << "\n";
  }
}

// Returns false when the host asked to quit.
bool run_command(const std::string& line, const ServerConfig& config, QuestionBank& bank,
                 SessionCoordinator& coordinator) {
  std::istringstream in(line);
  std::string cmd;
  in >> cmd;
  if (cmd.empty()) return true;

  std::string error;
  if (cmd == "quit" || cmd == "exit") {
    return false;
  } else if (cmd == "help") {
    print_help();
  } else if (cmd == "status") {
    print_status(coordinator.status());
  } else if (cmd == "start") {
    std::size_t count = config.quiz_size > 0 ? static_cast<std::size_t>(config.quiz_size) : 0;
    std::string arg;
    if (in >> arg) {
      auto n = livequiz::parse_int(arg);
      if (!n || *n <= 0) {
        std::cout << "  start expects a positive question count\n";
        return true;
      }
      count = static_cast<std::size_t>(*n);
    }
    auto questions = count > 0 ? bank.pick(count) : bank.all();
    report(coordinator.start_quiz(std::move(questions), &error), "start", error);
  } else if (cmd == "next") {
    report(coordinator.send_next_question(&error), "next", error);
  } else if (cmd == "skip") {
    report(coordinator.skip(&error), "skip", error);
  } else if (cmd == "force") {
    report(coordinator.force_next(&error), "force", error);
  } else if (cmd == "pause") {
    report(coordinator.pause(&error), "pause", error);
  } else if (cmd == "resume") {
    report(coordinator.resume(&error), "resume", error);
  } else if (cmd == "extend") {
    std::string arg;
    in >> arg;
    auto seconds = livequiz::parse_int(arg);
    if (!seconds) {
      std::cout << "  usage: extend <seconds>\n";
      return true;
    }
    report(coordinator.extend(*seconds, &error), "extend", error);
  } else if (cmd == "end") {
    if (!coordinator.end_quiz()) std::cout << "  no quiz running\n";
  } else if (cmd == "board") {
    print_board(coordinator.leaderboard());
  } else if (cmd == "results") {
    std::cout << coordinator.results_summary() << "\n";
  } else if (cmd == "analytics") {
    std::cout << coordinator.analytics_report() << "\n";
  } else if (cmd == "questions") {
    for (const auto& q : bank.all()) {
      std::cout << "  #" << q.id << " " << q.text << " [" << q.time_limit << "s, " << q.points
                << " pts]\n";
    }
  } else if (cmd == "say") {
    std::string text;
    std::getline(in >> std::ws, text);
    if (text.empty()) {
      std::cout << "  usage: say <text>\n";
    } else {
      coordinator.announce(text);
    }
  } else {
    std::cout << "  unknown command '" << cmd << "'\n";
    print_help();
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  std::string error;
  auto parsed = livequiz::server::parse_command_line(argc, argv, error);
  if (!parsed) {
    std::cerr << error << "\n" << livequiz::server::usage(argv[0]);
    return 2;
  }
  const ServerConfig config = *parsed;
  if (!livequiz::server::setup_logging(config, error)) {
    std::cerr << "[server] cannot set up logging: " << error << "\n";
    return 1;
  }

  QuestionBank bank;
  if (!load_questions(config, bank)) {
    std::cerr << "[server] no questions available, see logs\n";
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);

  ConsoleObserver observer;
  SessionCoordinator coordinator(livequiz::server::coordinator_config(config),
                                 livequiz::server::make_scoring_policy(config.scoring_policy));
  coordinator.set_observer(&observer);

  Server server(config.host, config.port, coordinator);
  if (!server.start(&error)) {
    std::cerr << "[server] failed to start: " << error << "\n";
    return 1;
  }

  std::cout << "[server] listening on " << config.host << ":" << server.port() << " with "
            << bank.size() << " questions. Type 'help' for commands, Ctrl+C to stop.\n";

  // Polled with a timeout so the loop also notices SIGINT/SIGTERM.
  livequiz::LineReader input(STDIN_FILENO);
  bool stdin_open = true;
  while (!g_stop.load()) {
    if (!stdin_open) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      continue;
    }
    std::string line;
    std::string read_error;
    if (input.read_line_for(line, 200, read_error)) {
      if (!run_command(line, config, bank, coordinator)) break;
    } else if (!read_error.empty()) {
      // Running detached from a terminal: keep serving until signalled.
      stdin_open = false;
    }
  }

  spdlog::info("shutting down");
  server.stop();
  coordinator.shutdown();
  coordinator.set_observer(nullptr);
  spdlog::shutdown();
  std::cout << "[server] stopped.\n";
  return 0;
}
