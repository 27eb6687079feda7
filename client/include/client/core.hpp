#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>

#include "common/message.hpp"

namespace livequiz::client {

struct ClientEvent {
  WireMessage message;
  bool disconnected{false};  // set on the last event once the link is gone
};

// Participant side of one server connection: a reader thread decodes lines
// into a queue the UI drains at its own pace.
class ClientCore {
 public:
  ClientCore();
  ~ClientCore();

  ClientCore(const ClientCore&) = delete;
  ClientCore& operator=(const ClientCore&) = delete;

  bool connect(const std::string& host, std::uint16_t port, std::string* error = nullptr);
  void disconnect();

  bool send(const WireMessage& msg, std::string& error);

  std::optional<ClientEvent> pop_event();
  std::optional<ClientEvent> wait_event(std::chrono::milliseconds timeout);

  bool is_connected() const { return connected_; }

 private:
  void reader_loop();
  void push(ClientEvent ev);

  int fd_{-1};
  std::atomic<bool> connected_{false};
  std::thread reader_;
  std::mutex send_mtx_;

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::queue<ClientEvent> queue_;
};

}  // namespace livequiz::client
