#include "server/config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "common/payloads.hpp"
#include "server/scoring.hpp"

namespace livequiz::server {

namespace {

using json = nlohmann::json;

bool read_flag_value(int argc, char** argv, int& i, const std::string& flag, std::string& out,
                     std::string& error) {
  if (i + 1 >= argc) {
    error = flag + " needs a value";
    return false;
  }
  out = argv[++i];
  return true;
}

bool parse_port(const std::string& text, std::uint16_t& port, std::string& error) {
  auto value = parse_int(text);
  if (!value || *value < 0 || *value > 65535) {
    error = "invalid port: " + text;
    return false;
  }
  port = static_cast<std::uint16_t>(*value);
  return true;
}

}  // namespace

std::optional<ServerConfig> load_config_file(const std::string& path, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "cannot open config file " + path;
    return std::nullopt;
  }
  json doc = json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    error = "config file " + path + " is not a JSON object";
    return std::nullopt;
  }

  ServerConfig config;
  try {
    config.host = doc.value("host", config.host);
    if (doc.contains("port")) {
      int port = doc.at("port").get<int>();
      if (port < 0 || port > 65535) {
        error = "port out of range in " + path;
        return std::nullopt;
      }
      config.port = static_cast<std::uint16_t>(port);
    }
    config.log_level = doc.value("log_level", config.log_level);
    config.log_file = doc.value("log_file", config.log_file);
    config.scoring_policy = doc.value("scoring_policy", config.scoring_policy);
    config.advance_policy = doc.value("advance_policy", config.advance_policy);
    config.advance_delay_ms = doc.value("advance_delay_ms", config.advance_delay_ms);
    config.start_delay_ms = doc.value("start_delay_ms", config.start_delay_ms);
    config.timeout_buffer_ms = doc.value("timeout_buffer_ms", config.timeout_buffer_ms);
    config.tick_interval_ms = doc.value("tick_interval_ms", config.tick_interval_ms);
    config.questions_file = doc.value("questions_file", config.questions_file);
    config.questions_db = doc.value("questions_db", config.questions_db);
    config.quiz_size = doc.value("quiz_size", config.quiz_size);
  } catch (const json::exception& ex) {
    error = "config file " + path + ": " + ex.what();
    return std::nullopt;
  }
  return config;
}

std::optional<ServerConfig> parse_command_line(int argc, char** argv, std::string& error) {
  ServerConfig config;

  // The config file is the base layer regardless of where --config appears.
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) != "--config") continue;
    std::string path;
    if (!read_flag_value(argc, argv, i, "--config", path, error)) return std::nullopt;
    auto loaded = load_config_file(path, error);
    if (!loaded) return std::nullopt;
    config = *loaded;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string value;
    if (arg == "--config") {
      ++i;
    } else if (arg == "--questions") {
      if (!read_flag_value(argc, argv, i, arg, config.questions_file, error)) return std::nullopt;
    } else if (arg == "--db") {
      if (!read_flag_value(argc, argv, i, arg, config.questions_db, error)) return std::nullopt;
    } else if (arg == "--policy") {
      if (!read_flag_value(argc, argv, i, arg, config.scoring_policy, error)) return std::nullopt;
    } else if (arg == "--advance") {
      if (!read_flag_value(argc, argv, i, arg, config.advance_policy, error)) return std::nullopt;
    } else if (arg == "--log-level") {
      if (!read_flag_value(argc, argv, i, arg, config.log_level, error)) return std::nullopt;
    } else if (arg == "--host") {
      if (!read_flag_value(argc, argv, i, arg, config.host, error)) return std::nullopt;
    } else if (arg == "--size") {
      if (!read_flag_value(argc, argv, i, arg, value, error)) return std::nullopt;
      auto size = parse_int(value);
      if (!size) {
        error = "invalid quiz size: " + value;
        return std::nullopt;
      }
      config.quiz_size = *size;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "unknown option " + arg;
      return std::nullopt;
    } else if (!parse_port(arg, config.port, error)) {
      return std::nullopt;
    }
  }

  if (!validate(config, error)) return std::nullopt;
  return config;
}

bool validate(const ServerConfig& config, std::string& error) {
  static const std::set<std::string> kLevels{"trace", "debug", "info",     "warn",
                                             "err",   "error", "critical", "off"};
  if (!kLevels.count(config.log_level)) {
    error = "unknown log level: " + config.log_level;
    return false;
  }
  if (!make_scoring_policy(config.scoring_policy)) {
    error = "unknown scoring policy: " + config.scoring_policy;
    return false;
  }
  if (!advance_policy_from_string(config.advance_policy)) {
    error = "unknown advance policy: " + config.advance_policy;
    return false;
  }
  if (config.advance_delay_ms < 0 || config.start_delay_ms < 0 || config.timeout_buffer_ms < 0) {
    error = "delays must not be negative";
    return false;
  }
  if (config.tick_interval_ms <= 0) {
    error = "tick_interval_ms must be positive";
    return false;
  }
  if (config.quiz_size < 0) {
    error = "quiz_size must not be negative";
    return false;
  }
  return true;
}

CoordinatorConfig coordinator_config(const ServerConfig& config) {
  CoordinatorConfig out;
  out.advance_policy =
      advance_policy_from_string(config.advance_policy).value_or(AdvancePolicy::WaitForAll);
  out.advance_delay = std::chrono::milliseconds(config.advance_delay_ms);
  out.start_delay = std::chrono::milliseconds(config.start_delay_ms);
  out.timeout_buffer = std::chrono::milliseconds(config.timeout_buffer_ms);
  out.tick_interval = std::chrono::milliseconds(config.tick_interval_ms);
  return out;
}

std::string usage(const std::string& program) {
  return "usage: " + program +
         " [port] [--config file.json] [--questions file.json] [--db questions.db]\n"
         "       [--policy streak|time-fraction] [--advance wait-for-all|delay-after-answer]\n"
         "       [--host addr] [--size n] [--log-level level]\n";
}

bool setup_logging(const ServerConfig& config, std::string& error) {
  try {
    const std::filesystem::path log_path(config.log_file);
    if (log_path.has_parent_path()) std::filesystem::create_directories(log_path.parent_path());

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.log_file, 1024 * 1024 * 5, 3);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    auto logger = std::make_shared<spdlog::logger>(
        "server", spdlog::sinks_init_list{file_sink, console_sink});
    spdlog::set_default_logger(logger);
  } catch (const std::filesystem::filesystem_error& e) {
    error = e.what();
    return false;
  } catch (const spdlog::spdlog_ex& e) {
    error = e.what();
    return false;
  }
  spdlog::set_level(spdlog::level::from_str(config.log_level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::flush_every(std::chrono::seconds(2));
  return true;
}

}  // namespace livequiz::server
