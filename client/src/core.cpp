#include "client/core.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

#include "common/codec.hpp"

namespace livequiz::client {

ClientCore::ClientCore() = default;

ClientCore::~ClientCore() {
  disconnect();
}

bool ClientCore::connect(const std::string& host, std::uint16_t port, std::string* error) {
  disconnect();
  auto fail = [&](const std::string& why) {
    if (error) *error = why;
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
    return false;
  };

  fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd_ < 0) return fail(std::string("socket: ") + std::strerror(errno));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    return fail("invalid host: " + host);
  }
  if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    return fail(std::string("connect: ") + std::strerror(errno));
  }
  {
    std::lock_guard<std::mutex> lock(queue_mtx_);
    std::queue<ClientEvent>().swap(queue_);
  }
  connected_.store(true);
  reader_ = std::thread(&ClientCore::reader_loop, this);
  return true;
}

void ClientCore::disconnect() {
  if (connected_.load() && fd_ >= 0) {
    std::string error;
    std::lock_guard<std::mutex> lock(send_mtx_);
    // The server treats EOF the same way, so a failed notice is only noted.
    if (!write_line(fd_, encode(make_message(MessageType::Disconnect)), error)) {
      std::cerr << "[client] disconnect notice not sent: " << error << "\n";
    }
  }
  connected_.store(false);
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
  if (reader_.joinable()) reader_.join();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool ClientCore::send(const WireMessage& msg, std::string& error) {
  if (!connected_.load()) {
    error = "not connected";
    return false;
  }
  std::lock_guard<std::mutex> lock(send_mtx_);
  return write_line(fd_, encode(msg), error);
}

std::optional<ClientEvent> ClientCore::pop_event() {
  std::lock_guard<std::mutex> lock(queue_mtx_);
  if (queue_.empty()) return std::nullopt;
  auto ev = std::move(queue_.front());
  queue_.pop();
  return ev;
}

std::optional<ClientEvent> ClientCore::wait_event(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(queue_mtx_);
  if (!queue_cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
    return std::nullopt;
  }
  auto ev = std::move(queue_.front());
  queue_.pop();
  return ev;
}

void ClientCore::push(ClientEvent ev) {
  {
    std::lock_guard<std::mutex> lock(queue_mtx_);
    queue_.push(std::move(ev));
  }
  queue_cv_.notify_all();
}

void ClientCore::reader_loop() {
  LineReader reader(fd_);
  while (connected_.load()) {
    std::string line;
    std::string error;
    if (!reader.read_line(line, error)) {
      if (connected_.load() && error != "EOF") {
        std::cerr << "[client] read error: " << error << "\n";
      }
      break;
    }
    auto msg = decode(line, error);
    if (!msg) {
      std::cerr << "[client] decode error: " << error << "\n";
      continue;
    }
    push(ClientEvent{std::move(*msg), false});
  }
  connected_.store(false);
  ClientEvent last;
  last.disconnected = true;
  push(std::move(last));
}

}  // namespace livequiz::client
