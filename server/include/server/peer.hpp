#pragma once

#include <cstdint>
#include <string>

namespace livequiz::server {

using ConnectionId = std::uint64_t;

// Outbound side of one participant connection as the coordinator sees it.
class Peer {
 public:
  virtual ~Peer() = default;

  virtual ConnectionId id() const = 0;
  virtual std::string describe() const = 0;

  // Writes one encoded line. Returns false if the peer is gone.
  virtual bool send_line(const std::string& line) = 0;

  // Idempotent; safe to call from any thread.
  virtual void close() = 0;
  virtual bool alive() const = 0;
};

}  // namespace livequiz::server
