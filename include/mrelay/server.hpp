/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef MRELAY_SERVER_HPP_
#define MRELAY_SERVER_HPP_

#include "config.hpp"
#include "connection.hpp"
#include "handlers.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <array>
#include <atomic>
#include <memory>
#include <poll.h>
#include <string>

namespace mrelay {

// ============================================================================
// Server (poll() reactor, one thread owns every client socket)
// ============================================================================

class Server {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  // Binds and listens. Throws std::runtime_error on failure.
  Server(const ServerConfig& config, HandlerContext ctx);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Runs the reactor until stop() (blocking). Returns at once if stop()
  // was already requested.
  void run();

  // Safe from any thread and from a signal handler
  void stop() { stop_requested_->store(true); }

  // Shared stop flag; may outlive the server
  using StopFlag = std::shared_ptr<std::atomic<bool>>;
  StopFlag stop_flag() const { return stop_requested_; }

  bool is_running() const { return is_running_; }

  // Configuration (applies to connections accepted afterwards)
  Server& set_max_connections(size_t max) {
    max_connections_ = max;
    return *this;
  }

  Server& set_frame_timeout_ms(uint32_t timeout) {
    limits_.frame_timeout_ms = timeout;
    return *this;
  }

  // Status
  size_t get_connection_count() const { return connections_.size(); }
  uint16_t port() const { return port_; }

  const ServerStats& stats() const { return stats_; }

  // Compile-time bound on simultaneously open connections
  static constexpr size_t kMaxConnections = 128;

 private:
  uint16_t port_;
  std::string bind_addr_;
  int server_sock_ = -1;
  std::atomic<bool> is_running_{false};
  StopFlag stop_requested_ = std::make_shared<std::atomic<bool>>(false);

  HandlerContext ctx_;
  FrameLimits limits_;

  FixedVector<ConnPtr, kMaxConnections> connections_;
  size_t max_connections_;
  int poll_timeout_ms_;

  // 1 for the acceptor + kMaxConnections for clients
  std::array<pollfd, kMaxConnections + 1> poll_fds_{};

  ServerStats stats_;

  expected<void, ErrorCode> accept_connection();
  void reject_connection();
  void handle_connection_io(ConnPtr& conn, const pollfd& pfd);
  void close_connection(ConnPtr& conn, ErrorCode reason);
  void remove_closed_connections();
};

}  // namespace mrelay

#endif  // MRELAY_SERVER_HPP_
