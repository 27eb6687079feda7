#include <unistd.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

#include "client/core.hpp"
#include "client/state.hpp"
#include "client/ui.hpp"
#include "common/codec.hpp"
#include "common/message.hpp"
#include "common/payloads.hpp"

namespace {

// Stdin is read through one buffered reader so no typed-ahead line is lost
// between the prompts and the quiz loop.
std::string prompt(livequiz::LineReader& input, const std::string& label) {
  std::cout << label << ": " << std::flush;
  std::string value;
  std::string error;
  if (!input.read_line(value, error)) return {};
  return value;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace livequiz::client;

  std::string host = argc > 1 ? argv[1] : "127.0.0.1";
  std::uint16_t port = livequiz::kDefaultPort;
  if (argc > 2) {
    auto p = livequiz::parse_int(argv[2]);
    if (!p || *p <= 0 || *p > 65535) {
      std::cerr << "invalid port: " << argv[2] << "\n";
      return 2;
    }
    port = static_cast<std::uint16_t>(*p);
  }

  livequiz::LineReader input(STDIN_FILENO);
  ParticipantState state;
  state.participant_id = argc > 3 ? argv[3] : prompt(input, "Student ID");
  state.name = argc > 4 ? argv[4] : prompt(input, "Name");
  if (state.participant_id.empty() || state.name.empty()) {
    std::cerr << "student id and name are required\n";
    return 2;
  }

  std::signal(SIGPIPE, SIG_IGN);

  ClientCore core;
  std::string error;
  if (!core.connect(host, port, &error)) {
    std::cerr << "[client] " << error << "\n";
    return 1;
  }
  if (!core.send(make_join(state), error)) {
    std::cerr << "[client] join failed: " << error << "\n";
    return 1;
  }
  std::cout << "[client] connected to " << host << ":" << port << "\n";
  render_help(std::cout);

  // Applies one server event; false once the connection is gone.
  auto handle = [&](const ClientEvent& ev) {
    if (ev.disconnected) {
      std::cout << "[client] connection closed by server\n";
      return false;
    }
    std::string apply_error;
    for (const auto& reply : apply_message(state, ev.message, apply_error)) {
      std::string send_error;
      if (!core.send(reply, send_error)) {
        std::cerr << "[client] send failed: " << send_error << "\n";
      }
    }
    if (!apply_error.empty()) {
      std::cerr << "[client] " << apply_error << "\n";
    } else {
      render_message(std::cout, state, ev.message);
    }
    return true;
  };

  bool running = true;
  bool stdin_open = true;
  while (running) {
    while (running) {
      auto ev = core.pop_event();
      if (!ev) break;
      running = handle(*ev);
    }
    if (!running) break;

    std::string line;
    if (!stdin_open) {
      // Input closed: keep following the quiz until the server hangs up.
      if (auto ev = core.wait_event(std::chrono::milliseconds(200))) running = handle(*ev);
      continue;
    }
    std::string read_error;
    if (!input.read_line_for(line, 100, read_error)) {
      if (!read_error.empty()) stdin_open = false;
      continue;
    }

    auto input = parse_input(line);
    switch (input.kind) {
      case InputKind::Answer: {
        auto answer = make_answer(state, input.option, std::chrono::steady_clock::now(), error);
        if (!answer) {
          std::cout << "[client] " << error << "\n";
        } else if (!core.send(*answer, error)) {
          std::cerr << "[client] send failed: " << error << "\n";
        }
        break;
      }
      case InputKind::Board:
        render_leaderboard(std::cout, state);
        break;
      case InputKind::Status:
        render_question(std::cout, state);
        std::cout << "score " << state.score << ", " << state.remaining << "s left"
                  << (state.paused ? " (paused)" : "") << "\n";
        break;
      case InputKind::Help:
        render_help(std::cout);
        break;
      case InputKind::Quit:
        running = false;
        break;
      case InputKind::Chat:
        if (!core.send(livequiz::make_message(livequiz::MessageType::Message, input.text),
                       error)) {
          std::cerr << "[client] send failed: " << error << "\n";
        }
        break;
      case InputKind::Empty:
        break;
    }
  }

  core.disconnect();
  std::cout << "[client] bye\n";
  return 0;
}
