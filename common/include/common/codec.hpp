#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common/message.hpp"

namespace livequiz {

constexpr std::size_t kMaxLineLength = 64 * 1024;  // 64 KiB safeguard.

// Backslash-escape '\', '|' and '~'; newline and carriage return become \n and \r.
std::string escape(const std::string& raw);
// Inverse of escape(). Returns std::nullopt on a dangling backslash.
std::optional<std::string> unescape(const std::string& escaped);

// Split on every unescaped `separator`, leaving escape sequences untouched.
// Returns std::nullopt if the input ends inside an escape sequence.
std::optional<std::vector<std::string>> split_escaped(const std::string& text, char separator);

// Encode a message into a single line (no trailing newline).
std::string encode(const WireMessage& msg);
std::string encode(const std::string& type, const std::string& payload);
std::string encode(const std::string& type, const std::string& id, const std::string& payload);

// Decode a single line (trailing "\r" / "\n" tolerated).
// Empty or malformed input yields std::nullopt and fills error; never throws.
std::optional<WireMessage> decode(const std::string& line, std::string& error);

// Payload fields: each field escaped, joined by '~'.
std::string join_fields(const std::vector<std::string>& fields);
std::optional<std::vector<std::string>> split_fields(const std::string& payload);

// Record lists (leaderboards): records built with join_fields, joined by '|'.
std::string join_records(const std::vector<std::string>& records);
std::optional<std::vector<std::string>> split_records(const std::string& payload);

// Writes line + '\n' fully. Returns false and fills error on failure.
bool write_line(int fd, const std::string& line, std::string& error);

// Buffered newline-delimited reader over a POSIX file descriptor.
class LineReader {
 public:
  explicit LineReader(int fd, std::size_t max_line = kMaxLineLength);

  // Blocks until a full line is available. Returns false on EOF or error
  // (error is "EOF" for an orderly close).
  bool read_line(std::string& line, std::string& error);

  // Like read_line() but waits at most timeout_ms for more input. A line
  // already buffered is returned without touching the descriptor. On
  // timeout returns false with error left empty.
  bool read_line_for(std::string& line, int timeout_ms, std::string& error);

 private:
  bool take_line(std::string& line);
  // One read() into the buffer; false with error set on EOF or failure.
  bool fill(std::string& error);

  int fd_;
  std::size_t max_line_;
  std::string buffer_;
};

}  // namespace livequiz
