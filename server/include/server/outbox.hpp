#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "server/peer.hpp"
#include "server/thread_pool.hpp"

namespace livequiz::server {

// Single writer for everything the coordinator sends. Lines are written in
// the order they were posted, so every peer sees broadcasts in emission
// order, and a slow peer delays the writer instead of the session lock.
class Outbox {
 public:
  // Called on the writer thread for a peer whose send failed.
  using FailureFn = std::function<void(const std::shared_ptr<Peer>&)>;

  explicit Outbox(FailureFn on_failure = {});
  ~Outbox();

  void post(std::vector<std::shared_ptr<Peer>> targets, std::string line);
  void post(std::shared_ptr<Peer> target, std::string line);

  // Blocks until everything posted before the call has been written.
  // Must not be called from the writer thread.
  void drain();
  void shutdown();

 private:
  FailureFn on_failure_;
  ThreadPool writer_{1};
};

}  // namespace livequiz::server
