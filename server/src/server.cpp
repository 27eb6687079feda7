#include "server/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/codec.hpp"
#include "common/payloads.hpp"
#include "server/coordinator.hpp"

namespace livequiz::server {

namespace {

constexpr int kSendTimeoutSeconds = 5;

int create_listen_socket(const std::string& host, std::uint16_t port, std::string& error) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    error = std::string("socket: ") + std::strerror(errno);
    return -1;
  }
  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    error = "invalid host: " + host;
    ::close(fd);
    return -1;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    error = std::string("bind: ") + std::strerror(errno);
    ::close(fd);
    return -1;
  }
  if (::listen(fd, 64) < 0) {
    error = std::string("listen: ") + std::strerror(errno);
    ::close(fd);
    return -1;
  }
  return fd;
}

std::uint16_t bound_port(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
  return ntohs(addr.sin_port);
}

std::string peer_addr(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    char buf[64];
    ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    std::ostringstream oss;
    oss << buf << ":" << ntohs(addr.sin_port);
    return oss.str();
  }
  return "unknown";
}

}  // namespace

Server::Server(std::string host, std::uint16_t port, SessionCoordinator& coordinator)
    : host_(std::move(host)), port_(port), coordinator_(coordinator) {}

Server::~Server() {
  stop();
}

bool Server::start(std::string* error) {
  if (running_.load()) return true;
  std::string why;
  listen_fd_ = create_listen_socket(host_, port_, why);
  if (listen_fd_ < 0) {
    spdlog::error("failed to listen on {}:{}: {}", host_, port_, why);
    if (error) *error = why;
    return false;
  }
  port_ = bound_port(listen_fd_);
  running_.store(true);
  accept_thread_ = std::thread(&Server::accept_loop, this);
  spdlog::info("listening on {}:{}", host_, port_);
  return true;
}

void Server::stop() {
  if (!running_.exchange(false)) return;
  if (listen_fd_ >= 0) {
    // shutdown() wakes a thread blocked in accept(); close() alone may not.
    ::shutdown(listen_fd_, SHUT_RDWR);
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) accept_thread_.join();

  std::map<ConnectionId, std::shared_ptr<Connection>> to_close;
  {
    std::lock_guard<std::mutex> lock(conns_mtx_);
    to_close.swap(connections_);
  }
  for (auto& [id, conn] : to_close) conn->close();
  readers_.shutdown();
  spdlog::info("server stopped ({} connections closed)", to_close.size());
}

std::size_t Server::connection_count() const {
  std::lock_guard<std::mutex> lock(conns_mtx_);
  return connections_.size();
}

void Server::accept_loop() {
  while (running_.load()) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    if (client_fd < 0) {
      if (errno == EINTR) continue;
      if (!running_.load()) break;
      spdlog::warn("accept failed: {}", std::strerror(errno));
      continue;
    }

    // A peer that stops reading must not stall the writer forever.
    timeval tv{};
    tv.tv_sec = kSendTimeoutSeconds;
    ::setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    std::shared_ptr<Connection> conn;
    {
      std::lock_guard<std::mutex> lock(conns_mtx_);
      conn = std::make_shared<Connection>(client_fd, next_id_++, peer_addr(client_fd),
                                          coordinator_, this);
      connections_[conn->id()] = conn;
    }
    spdlog::info("new connection {} from {}", conn->id(), conn->describe());
    coordinator_.accept_connection(conn);
    if (!readers_.enqueue([conn] { conn->read_loop(); })) {
      conn->close();
    }
  }
}

void Server::forget(ConnectionId id) {
  std::lock_guard<std::mutex> lock(conns_mtx_);
  connections_.erase(id);
}

Connection::Connection(int fd, ConnectionId id, std::string peer,
                       SessionCoordinator& coordinator, Server* server)
    : fd_(fd), id_(id), peer_(std::move(peer)), coordinator_(coordinator), server_(server) {}

Connection::~Connection() {
  if (fd_ >= 0) ::close(fd_);
}

bool Connection::send_line(const std::string& line) {
  if (!alive_.load()) return false;
  std::lock_guard<std::mutex> lock(send_mtx_);
  std::string error;
  if (!write_line(fd_, line, error)) {
    spdlog::warn("send error to {}: {}", peer_, error);
    return false;
  }
  return true;
}

void Connection::close() {
  if (!alive_.exchange(false)) return;
  // The descriptor stays open until destruction so a concurrent reader or
  // writer never sees a reused fd number.
  ::shutdown(fd_, SHUT_RDWR);
  spdlog::info("connection {} ({}) closed", id_, peer_);
  coordinator_.remove_connection(id_);
  if (server_) server_->forget(id_);
}

void Connection::read_loop() {
  auto self = shared_from_this();
  LineReader reader(fd_);
  while (alive_.load()) {
    std::string line;
    std::string error;
    if (!reader.read_line(line, error)) {
      if (alive_.load() && error != "EOF") {
        spdlog::warn("read error from {}: {}", peer_, error);
      }
      break;
    }
    auto msg = decode(line, error);
    if (!msg) {
      spdlog::warn("malformed line from {}: {}", peer_, error);
      continue;
    }
    dispatch(*msg);
  }
  close();
}

void Connection::dispatch(const WireMessage& msg) {
  auto type = message_type_from_string(msg.type);
  if (!type) {
    spdlog::warn("unknown message type '{}' from {}", msg.type, peer_);
    return;
  }

  std::string error;
  switch (*type) {
    case MessageType::StudentJoin: {
      auto join = parse_join(msg.payload, error);
      if (!join) {
        spdlog::warn("bad join from {}: {}", peer_, error);
        coordinator_.reject(id_, "malformed join: " + error);
        return;
      }
      coordinator_.join(id_, join->participant_id, join->name);
      break;
    }
    case MessageType::Answer: {
      auto answer = parse_answer(msg.payload, error);
      if (!answer) {
        spdlog::warn("bad answer from {}: {}", peer_, error);
        coordinator_.reject(id_, "malformed answer: " + error);
        return;
      }
      coordinator_.submit_answer(id_, answer->question_id, answer->option, answer->latency_ms);
      break;
    }
    case MessageType::Message:
      coordinator_.chat(id_, msg.payload);
      break;
    case MessageType::Ack:
      if (msg.id) coordinator_.acknowledge(id_, *msg.id);
      break;
    case MessageType::Disconnect:
      spdlog::info("{} requested disconnect", peer_);
      close();
      break;
    default:
      spdlog::warn("unexpected {} from {}", msg.type, peer_);
      break;
  }
}

}  // namespace livequiz::server
