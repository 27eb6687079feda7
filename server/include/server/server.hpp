#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "common/message.hpp"
#include "server/peer.hpp"
#include "server/thread_pool.hpp"

namespace livequiz::server {

class Connection;
class SessionCoordinator;

// TCP front end: owns the listening socket and the accept thread and hands
// every accepted socket to the coordinator as a Connection.
class Server {
 public:
  Server(std::string host, std::uint16_t port, SessionCoordinator& coordinator);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  bool start(std::string* error = nullptr);
  void stop();
  bool running() const { return running_.load(); }

  // Bound port; differs from the requested one when that was 0.
  std::uint16_t port() const { return port_; }
  std::size_t connection_count() const;

 private:
  friend class Connection;

  void accept_loop();
  void forget(ConnectionId id);

  std::string host_;
  std::uint16_t port_;
  SessionCoordinator& coordinator_;
  std::atomic<bool> running_{false};
  int listen_fd_{-1};
  std::thread accept_thread_;

  mutable std::mutex conns_mtx_;
  std::map<ConnectionId, std::shared_ptr<Connection>> connections_;
  ConnectionId next_id_{1};

  ThreadPool readers_;  // one blocking read loop per connection
};

class Connection : public Peer, public std::enable_shared_from_this<Connection> {
 public:
  Connection(int fd, ConnectionId id, std::string peer, SessionCoordinator& coordinator,
             Server* server);
  ~Connection() override;

  ConnectionId id() const override { return id_; }
  std::string describe() const override { return peer_; }
  bool send_line(const std::string& line) override;
  void close() override;
  bool alive() const override { return alive_.load(); }

  void read_loop();

 private:
  void dispatch(const WireMessage& msg);

  int fd_;
  ConnectionId id_;
  std::string peer_;
  SessionCoordinator& coordinator_;
  Server* server_;
  std::atomic<bool> alive_{true};
  std::mutex send_mtx_;
};

}  // namespace livequiz::server
