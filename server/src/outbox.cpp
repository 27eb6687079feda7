#include "server/outbox.hpp"

#include <future>

#include <spdlog/spdlog.h>

namespace livequiz::server {

Outbox::Outbox(FailureFn on_failure) : on_failure_(std::move(on_failure)) {}

Outbox::~Outbox() {
  shutdown();
}

void Outbox::post(std::vector<std::shared_ptr<Peer>> targets, std::string line) {
  if (targets.empty()) return;
  writer_.enqueue([this, targets = std::move(targets), line = std::move(line)] {
    for (const auto& peer : targets) {
      if (!peer || !peer->alive()) continue;
      if (!peer->send_line(line)) {
        spdlog::warn("dropping {}: send failed", peer->describe());
        if (on_failure_) on_failure_(peer);
      }
    }
  });
}

void Outbox::post(std::shared_ptr<Peer> target, std::string line) {
  std::vector<std::shared_ptr<Peer>> targets;
  targets.push_back(std::move(target));
  post(std::move(targets), std::move(line));
}

void Outbox::drain() {
  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if (!writer_.enqueue([done] { done->set_value(); })) return;
  future.wait();
}

void Outbox::shutdown() {
  writer_.shutdown();
}

}  // namespace livequiz::server
