#pragma once

#include <ostream>
#include <string>

#include "client/state.hpp"
#include "common/message.hpp"

namespace livequiz::client {

// Console rendering of what changed after `msg` was applied to `state`.
void render_message(std::ostream& out, const ParticipantState& state, const WireMessage& msg);

void render_question(std::ostream& out, const ParticipantState& state);
void render_leaderboard(std::ostream& out, const ParticipantState& state);
void render_help(std::ostream& out);

enum class InputKind { Answer, Board, Status, Help, Quit, Chat, Empty };

struct ParsedInput {
  InputKind kind{InputKind::Empty};
  int option{-1};
  std::string text;
};

// "a".."d" (or 1..4) answer, "/board", "/status", "/help", "/quit";
// anything else is chat.
ParsedInput parse_input(const std::string& line);

}  // namespace livequiz::client
