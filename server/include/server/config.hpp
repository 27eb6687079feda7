#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "common/message.hpp"
#include "server/coordinator.hpp"

namespace livequiz::server {

struct ServerConfig {
  std::string host{"0.0.0.0"};
  std::uint16_t port{kDefaultPort};
  std::string log_level{"info"};
  std::string log_file{"logs/server.log"};
  std::string scoring_policy{"streak"};
  std::string advance_policy{"wait-for-all"};
  int advance_delay_ms{3000};
  int start_delay_ms{3000};
  int timeout_buffer_ms{5000};
  int tick_interval_ms{1000};
  std::string questions_file;  // JSON; empty means built-in questions
  std::string questions_db;    // SQLite; takes precedence over questions_file
  int quiz_size{0};            // 0 = every loaded question
};

// Reads a JSON object; keys that are absent keep their defaults.
std::optional<ServerConfig> load_config_file(const std::string& path, std::string& error);

// `--config path` is read first, then a positional port and the remaining
// flags override it.
std::optional<ServerConfig> parse_command_line(int argc, char** argv, std::string& error);

// Rejects unknown policy names, out-of-range numbers and unknown log levels.
bool validate(const ServerConfig& config, std::string& error);

CoordinatorConfig coordinator_config(const ServerConfig& config);

// Installs the default logger: a rotating file at log_file plus warnings on
// the console. False with error set when the file cannot be opened.
bool setup_logging(const ServerConfig& config, std::string& error);

std::string usage(const std::string& program);

}  // namespace livequiz::server
