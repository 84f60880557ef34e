/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "mrelay/server.hpp"

#include "mrelay/log.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <chrono>
#include <fcntl.h>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace mrelay {

namespace {

std::string peer_name(const sockaddr_in& addr) {
  char ip[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) == nullptr) {
    return "unknown";
  }
  return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

bool is_framing_error(ErrorCode code) {
  return code == ErrorCode::kFrameParseError || code == ErrorCode::kPayloadTooLarge ||
         code == ErrorCode::kUnknownOpcode || code == ErrorCode::kTimeout;
}

}  // namespace

Server::Server(const ServerConfig& config, HandlerContext ctx)
    : port_(config.port),
      bind_addr_(config.bind_addr),
      ctx_(ctx),
      max_connections_(config.max_connections),
      poll_timeout_ms_(config.poll_timeout_ms) {
  limits_.max_payload_size = config.max_payload_size;
  limits_.frame_timeout_ms = config.frame_timeout_ms;

  server_sock_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_sock_ < 0) {
    throw std::runtime_error(std::string("Failed to create socket: ") + strerror(errno));
  }

  int reuse = 1;
  if (setsockopt(server_sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    MRELAY_LOG_WARN(std::string("SO_REUSEADDR failed: ") + strerror(errno));
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (bind_addr_.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, bind_addr_.c_str(), &addr.sin_addr) != 1) {
    close(server_sock_);
    throw std::runtime_error("Invalid bind address " + bind_addr_);
  }

  if (bind(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    close(server_sock_);
    throw std::runtime_error("Failed to bind port " + std::to_string(port_) + ": " + strerror(err));
  }

  if (listen(server_sock_, config.backlog) < 0) {
    int err = errno;
    close(server_sock_);
    throw std::runtime_error(std::string("Failed to listen: ") + strerror(err));
  }

  if (fcntl(server_sock_, F_SETFL, O_NONBLOCK) < 0) {
    int err = errno;
    close(server_sock_);
    throw std::runtime_error(std::string("Failed to set non-blocking: ") + strerror(err));
  }

  // Resolve an ephemeral port
  socklen_t addr_len = sizeof(addr);
  if (getsockname(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) == 0) {
    port_ = ntohs(addr.sin_port);
  }

  MRELAY_LOG_INFO("Server listening on " + (bind_addr_.empty() ? std::string("0.0.0.0") : bind_addr_) + ":" +
                  std::to_string(port_));
}

Server::~Server() {
  connections_.clear();
  if (server_sock_ >= 0) {
    close(server_sock_);
  }
}

void Server::run() {
  if (stop_requested_->load()) {
    MRELAY_LOG_INFO("Stop requested before start");
    return;
  }
  is_running_ = true;
  stats_.reset();
  MRELAY_LOG_INFO("Server starting...");

  while (!stop_requested_->load()) {
    size_t nfds = 0;
    poll_fds_[nfds++] = {server_sock_, POLLIN, 0};

    // One request at a time per connection: write-only while a response is queued
    for (uint32_t i = 0; i < connections_.size(); ++i) {
      short events = connections_[i]->has_data_to_send() ? POLLOUT : POLLIN;
      poll_fds_[nfds++] = {connections_[i]->get_fd(), events, 0};
    }

    auto poll_start = std::chrono::steady_clock::now();
    int ret = ::poll(poll_fds_.data(), static_cast<nfds_t>(nfds), poll_timeout_ms_);
    auto poll_end = std::chrono::steady_clock::now();

    uint64_t poll_us =
        static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(poll_end - poll_start).count());
    stats_.last_poll_latency_us.store(poll_us, std::memory_order_relaxed);
    if (poll_us > stats_.max_poll_latency_us.load(std::memory_order_relaxed)) {
      stats_.max_poll_latency_us.store(poll_us, std::memory_order_relaxed);
    }

    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      MRELAY_LOG_ERROR(std::string("Poll error: ") + strerror(errno));
      break;
    }

    if (ret > 0) {
      if (poll_fds_[0].revents & POLLIN) {
        accept_connection();
      }

      // Connections accepted above sit past nfds and wait for the next round
      for (size_t i = 1; i < nfds; ++i) {
        handle_connection_io(connections_[static_cast<uint32_t>(i - 1)], poll_fds_[i]);
      }
    }

    for (uint32_t i = 0; i < connections_.size(); ++i) {
      auto& conn = connections_[i];
      if (!conn->is_closed() && conn->is_frame_timed_out()) {
        close_connection(conn, ErrorCode::kTimeout);
      }
    }

    remove_closed_connections();
  }

  for (uint32_t i = 0; i < connections_.size(); ++i) {
    connections_[i]->close();
  }
  remove_closed_connections();
  is_running_ = false;
  MRELAY_LOG_INFO("Server stopped");
}

expected<void, ErrorCode> Server::accept_connection() {
  struct sockaddr_in client_addr;
  socklen_t client_addr_len = sizeof(client_addr);
  int client_sock = accept(server_sock_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_addr_len);

  if (client_sock < 0) {
    int err = errno;
    if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
      MRELAY_LOG_ERROR(std::string("Accept error: ") + strerror(err));
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
    return expected<void, ErrorCode>::success();
  }

  // Overload protection: accept and immediately close to drain the queue
  if (connections_.size() >= max_connections_ || connections_.full()) {
    ::close(client_sock);
    stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
    MRELAY_LOG_WARN("Max connections reached, rejected " + peer_name(client_addr));
    return expected<void, ErrorCode>::error(ErrorCode::kMaxConnectionsExceeded);
  }

  auto conn = std::make_shared<Connection>(client_sock, ctx_, limits_, stats_);
  connections_.push_back(conn);

  stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
  stats_.active_connections.fetch_add(1, std::memory_order_relaxed);
  MRELAY_LOG_INFO("Connection " + std::to_string(conn->get_id()) + " from " + peer_name(client_addr));
  return expected<void, ErrorCode>::success();
}

void Server::handle_connection_io(ConnPtr& conn, const pollfd& pfd) {
  if (conn->is_closed()) {
    return;
  }

  if (pfd.revents & POLLIN) {
    auto read_result = conn->handle_read();
    if (!read_result.has_value()) {
      close_connection(conn, read_result.get_error());
      return;
    }
  }

  // Flush a fresh response right away; POLLOUT picks up the remainder
  if ((pfd.revents & (POLLIN | POLLOUT)) && conn->has_data_to_send()) {
    auto write_result = conn->handle_write();
    if (!write_result.has_value()) {
      close_connection(conn, write_result.get_error());
      return;
    }
  }

  if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
    close_connection(conn, ErrorCode::kConnectionClosed);
  }
}

void Server::close_connection(ConnPtr& conn, ErrorCode reason) {
  if (conn->is_closed()) {
    return;
  }

  if (is_framing_error(reason)) {
    stats_.framing_errors.fetch_add(1, std::memory_order_relaxed);
    MRELAY_LOG_ERROR("Connection " + std::to_string(conn->get_id()) + " closed on framing error: " +
                     to_string(reason));
  } else if (reason == ErrorCode::kSocketError) {
    stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
    MRELAY_LOG_ERROR("Connection " + std::to_string(conn->get_id()) + " closed on socket error");
  } else if (reason == ErrorCode::kConnectionClosed) {
    MRELAY_LOG_INFO("Connection " + std::to_string(conn->get_id()) + " closed by peer");
  } else {
    MRELAY_LOG_ERROR("Connection " + std::to_string(conn->get_id()) + " closed: " + to_string(reason));
  }

  conn->close();
}

void Server::remove_closed_connections() {
  uint32_t removed = 0;
  uint32_t i = 0;
  while (i < connections_.size()) {
    if (connections_[i]->is_closed()) {
      connections_.erase_unordered(i);
      ++removed;
    } else {
      ++i;
    }
  }
  if (removed > 0) {
    stats_.active_connections.fetch_sub(removed, std::memory_order_relaxed);
  }
}

}  // namespace mrelay
