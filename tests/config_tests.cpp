#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "server/config.hpp"
#include "test_runner.hpp"

using livequiz::server::ServerConfig;
using livequiz::test::TestRunner;

namespace fs = std::filesystem;

namespace {

std::optional<ServerConfig> parse(std::vector<std::string> args, std::string& error) {
  args.insert(args.begin(), "livequiz_server");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  return livequiz::server::parse_command_line(static_cast<int>(argv.size()), argv.data(), error);
}

}  // namespace

int main() {
  TestRunner tr("config");

  {
    std::string err;
    auto cfg = parse({}, err);
    tr.expect(cfg && cfg->port == livequiz::kDefaultPort && cfg->advance_policy == "wait-for-all",
              "defaults");
    cfg = parse({"9000", "--policy", "time-fraction", "--size", "4", "--host", "127.0.0.1"}, err);
    tr.expect(cfg && cfg->port == 9000 && cfg->scoring_policy == "time-fraction" &&
                  cfg->quiz_size == 4 && cfg->host == "127.0.0.1",
              "flags applied");
    tr.expect(!parse({"--policy", "random"}, err) && !err.empty(), "unknown policy rejected");
    tr.expect(!parse({"--advance", "never"}, err), "unknown advance policy rejected");
    tr.expect(!parse({"70000"}, err), "port out of range");
    tr.expect(!parse({"--frobnicate"}, err), "unknown flag rejected");
    tr.expect(!parse({"--db"}, err), "missing flag value");
    tr.expect(!parse({"--size", "-1"}, err), "negative quiz size rejected");
  }

  {
    auto path = fs::temp_directory_path() /
                ("livequiz_" + std::to_string(::getpid()) + "_server.json");
    {
      std::ofstream out(path);
      out << R"({"port": 9100, "advance_policy": "delay-after-answer", "advance_delay_ms": 500,
                 "log_level": "debug"})";
    }
    std::string err;
    auto cfg = parse({"--config", path.string(), "--log-level", "warn"}, err);
    tr.expect(cfg && cfg->port == 9100 && cfg->advance_delay_ms == 500, "file values read");
    tr.expect(cfg && cfg->log_level == "warn", "flags override the file");
    auto cc = livequiz::server::coordinator_config(*cfg);
    tr.expect(cc.advance_policy == livequiz::server::AdvancePolicy::DelayAfterAnswer &&
                  cc.advance_delay == std::chrono::milliseconds(500),
              "coordinator config derived");

    {
      std::ofstream out(path);
      out << R"({"port": "eighty"})";
    }
    tr.expect(!livequiz::server::load_config_file(path.string(), err), "type mismatch rejected");
    {
      std::ofstream out(path);
      out << "[1, 2]";
    }
    tr.expect(!livequiz::server::load_config_file(path.string(), err), "non-object rejected");
    tr.expect(!livequiz::server::load_config_file("/nonexistent/livequiz.json", err),
              "missing file rejected");
    fs::remove(path);
  }

  {
    ServerConfig cfg;
    std::string err;
    tr.expect(livequiz::server::validate(cfg, err), "defaults valid");
    cfg.tick_interval_ms = 0;
    tr.expect(!livequiz::server::validate(cfg, err), "tick must be positive");
    cfg = ServerConfig{};
    cfg.log_level = "loud";
    tr.expect(!livequiz::server::validate(cfg, err), "unknown log level");
  }

  // An unusable log path is reported instead of thrown.
  {
    auto blocker = fs::temp_directory_path() /
                   ("livequiz_" + std::to_string(::getpid()) + "_blocker");
    {
      std::ofstream out(blocker);
      out << "not a directory";
    }
    ServerConfig cfg;
    cfg.log_file = (blocker / "logs" / "server.log").string();
    std::string err;
    tr.expect(!livequiz::server::setup_logging(cfg, err) && !err.empty(),
              "log directory under a regular file rejected");
    fs::remove(blocker);
  }

  return tr.exit_code();
}
