#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace livequiz {

constexpr std::uint16_t kDefaultPort = 8888;

constexpr char kDelimiter = '|';
constexpr char kFieldSeparator = '~';
constexpr char kEscape = '\\';

enum class MessageType {
  Connect,
  Disconnect,
  StudentJoin,
  QuizStart,
  QuizEnd,
  Question,
  Answer,
  Result,
  Leaderboard,
  TimerSync,
  TimerControl,
  Message,
  Error,
  Ack
};

// One line on the wire: TYPE|[id|]payload.
// The type is kept as the raw tag so that unknown tags survive decoding and
// can be reported by whoever dispatches on them.
struct WireMessage {
  std::string type;
  std::optional<std::string> id;
  std::string payload;

  bool operator==(const WireMessage& other) const {
    return type == other.type && id == other.id && payload == other.payload;
  }
  bool operator!=(const WireMessage& other) const { return !(*this == other); }
};

std::string to_string(MessageType type);
std::optional<MessageType> message_type_from_string(const std::string& value);

WireMessage make_message(MessageType type, std::string payload = {});
WireMessage make_message(MessageType type, std::string id, std::string payload);

}  // namespace livequiz
