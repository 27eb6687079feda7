#include "common/codec.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace livequiz {
namespace {

void strip_line_ending(std::string& line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
}

ssize_t send_exact(int fd, const char* data, std::size_t length) {
  std::size_t total = 0;
  while (total < length) {
    // MSG_NOSIGNAL: a peer that went away must not raise SIGPIPE.
    ssize_t n = ::send(fd, data + total, length - total, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    total += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(total);
}

}  // namespace

// Message helpers implementation
std::string to_string(MessageType type) {
  switch (type) {
    case MessageType::Connect:
      return "CONNECT";
    case MessageType::Disconnect:
      return "DISCONNECT";
    case MessageType::StudentJoin:
      return "STUDENT_JOIN";
    case MessageType::QuizStart:
      return "QUIZ_START";
    case MessageType::QuizEnd:
      return "QUIZ_END";
    case MessageType::Question:
      return "QUESTION";
    case MessageType::Answer:
      return "ANSWER";
    case MessageType::Result:
      return "RESULT";
    case MessageType::Leaderboard:
      return "LEADERBOARD";
    case MessageType::TimerSync:
      return "TIMER_SYNC";
    case MessageType::TimerControl:
      return "TIMER_CONTROL";
    case MessageType::Message:
      return "MESSAGE";
    case MessageType::Error:
      return "ERROR";
    case MessageType::Ack:
      return "ACK";
  }
  return "ERROR";
}

std::optional<MessageType> message_type_from_string(const std::string& value) {
  if (value == "CONNECT") return MessageType::Connect;
  if (value == "DISCONNECT") return MessageType::Disconnect;
  if (value == "STUDENT_JOIN") return MessageType::StudentJoin;
  if (value == "QUIZ_START") return MessageType::QuizStart;
  if (value == "QUIZ_END") return MessageType::QuizEnd;
  if (value == "QUESTION") return MessageType::Question;
  if (value == "ANSWER") return MessageType::Answer;
  if (value == "RESULT") return MessageType::Result;
  if (value == "LEADERBOARD") return MessageType::Leaderboard;
  if (value == "TIMER_SYNC") return MessageType::TimerSync;
  if (value == "TIMER_CONTROL") return MessageType::TimerControl;
  if (value == "MESSAGE") return MessageType::Message;
  if (value == "ERROR") return MessageType::Error;
  if (value == "ACK") return MessageType::Ack;
  return std::nullopt;
}

WireMessage make_message(MessageType type, std::string payload) {
  WireMessage msg;
  msg.type = to_string(type);
  msg.payload = std::move(payload);
  return msg;
}

WireMessage make_message(MessageType type, std::string id, std::string payload) {
  WireMessage msg;
  msg.type = to_string(type);
  msg.id = std::move(id);
  msg.payload = std::move(payload);
  return msg;
}

std::string escape(const std::string& raw) {
  std::string out;
  out.reserve(raw.size() + raw.size() / 8);
  for (char c : raw) {
    switch (c) {
      case kEscape:
      case kDelimiter:
      case kFieldSeparator:
        out.push_back(kEscape);
        out.push_back(c);
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::optional<std::string> unescape(const std::string& escaped) {
  std::string out;
  out.reserve(escaped.size());
  for (std::size_t i = 0; i < escaped.size(); ++i) {
    char c = escaped[i];
    if (c != kEscape) {
      out.push_back(c);
      continue;
    }
    if (i + 1 >= escaped.size()) return std::nullopt;
    char next = escaped[++i];
    if (next == 'n') {
      out.push_back('\n');
    } else if (next == 'r') {
      out.push_back('\r');
    } else {
      out.push_back(next);
    }
  }
  return out;
}

std::optional<std::vector<std::string>> split_escaped(const std::string& text, char separator) {
  std::vector<std::string> parts;
  std::string current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == kEscape) {
      if (i + 1 >= text.size()) return std::nullopt;
      current.push_back(c);
      current.push_back(text[++i]);
    } else if (c == separator) {
      parts.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  parts.push_back(std::move(current));
  return parts;
}

std::string encode(const WireMessage& msg) {
  std::string line = escape(msg.type);
  line.push_back(kDelimiter);
  if (msg.id) {
    line += escape(*msg.id);
    line.push_back(kDelimiter);
  }
  line += escape(msg.payload);
  return line;
}

std::string encode(const std::string& type, const std::string& payload) {
  return encode(WireMessage{type, std::nullopt, payload});
}

std::string encode(const std::string& type, const std::string& id, const std::string& payload) {
  return encode(WireMessage{type, id, payload});
}

std::optional<WireMessage> decode(const std::string& line, std::string& error) {
  std::string raw = line;
  strip_line_ending(raw);
  if (raw.empty()) {
    error = "empty message";
    return std::nullopt;
  }

  auto parts = split_escaped(raw, kDelimiter);
  if (!parts) {
    error = "dangling escape character";
    return std::nullopt;
  }
  if (parts->size() > 3) {
    error = "too many top-level fields";
    return std::nullopt;
  }

  std::vector<std::string> fields;
  fields.reserve(parts->size());
  for (const auto& p : *parts) {
    auto field = unescape(p);
    if (!field) {
      error = "invalid escape sequence";
      return std::nullopt;
    }
    fields.push_back(std::move(*field));
  }

  WireMessage msg;
  msg.type = fields[0];
  if (msg.type.empty()) {
    error = "message type missing";
    return std::nullopt;
  }
  if (fields.size() == 2) {
    msg.payload = fields[1];
  } else if (fields.size() == 3) {
    msg.id = fields[1];
    msg.payload = fields[2];
  }
  return msg;
}

std::string join_fields(const std::vector<std::string>& fields) {
  std::string out;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) out.push_back(kFieldSeparator);
    out += escape(fields[i]);
  }
  return out;
}

std::optional<std::vector<std::string>> split_fields(const std::string& payload) {
  auto parts = split_escaped(payload, kFieldSeparator);
  if (!parts) return std::nullopt;
  std::vector<std::string> fields;
  fields.reserve(parts->size());
  for (const auto& p : *parts) {
    auto field = unescape(p);
    if (!field) return std::nullopt;
    fields.push_back(std::move(*field));
  }
  return fields;
}

std::string join_records(const std::vector<std::string>& records) {
  std::string out;
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (i > 0) out.push_back(kDelimiter);
    out += records[i];
  }
  return out;
}

std::optional<std::vector<std::string>> split_records(const std::string& payload) {
  if (payload.empty()) return std::vector<std::string>{};
  return split_escaped(payload, kDelimiter);
}

bool write_line(int fd, const std::string& line, std::string& error) {
  if (fd < 0) {
    error = "socket closed";
    return false;
  }
  if (line.size() + 1 > kMaxLineLength) {
    error = "line too long";
    return false;
  }
  std::string out = line;
  out.push_back('\n');
  ssize_t n = send_exact(fd, out.data(), out.size());
  if (n != static_cast<ssize_t>(out.size())) {
    error = std::string("failed to write line: ") + std::strerror(errno);
    return false;
  }
  return true;
}

LineReader::LineReader(int fd, std::size_t max_line) : fd_(fd), max_line_(max_line) {}

bool LineReader::take_line(std::string& line) {
  auto pos = buffer_.find('\n');
  if (pos == std::string::npos) return false;
  line = buffer_.substr(0, pos);
  buffer_.erase(0, pos + 1);
  strip_line_ending(line);
  return true;
}

bool LineReader::fill(std::string& error) {
  if (buffer_.size() > max_line_) {
    error = "line too long";
    return false;
  }
  char chunk[4096];
  while (true) {
    ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n == 0) {
      error = "EOF";
      return false;
    }
    if (n < 0) {
      if (errno == EINTR) continue;
      error = std::string("read failed: ") + std::strerror(errno);
      return false;
    }
    buffer_.append(chunk, static_cast<std::size_t>(n));
    return true;
  }
}

bool LineReader::read_line(std::string& line, std::string& error) {
  while (!take_line(line)) {
    if (!fill(error)) return false;
  }
  return true;
}

bool LineReader::read_line_for(std::string& line, int timeout_ms, std::string& error) {
  error.clear();
  if (take_line(line)) return true;
  pollfd pfd{fd_, POLLIN, 0};
  int rc = ::poll(&pfd, 1, timeout_ms);
  if (rc < 0 && errno != EINTR) {
    error = std::string("poll failed: ") + std::strerror(errno);
    return false;
  }
  if (rc <= 0) return false;
  if (!fill(error)) return false;
  return take_line(line);
}

}  // namespace livequiz
