/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * One client connection: request framing, dispatch and response buffering.
 */

#ifndef MRELAY_CONNECTION_HPP_
#define MRELAY_CONNECTION_HPP_

#include "handlers.hpp"
#include "protocol.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <array>
#include <chrono>
#include <memory>
#include <sockpp/tcp_socket.h>
#include <vector>

namespace mrelay {

// ============================================================================
// Connection state (function-pointer state machine, no virtual)
// ============================================================================

enum class ConnectionState : uint8_t {
  kAwaitingHeader,   // Filling the 23-byte request header
  kAwaitingPayload,  // Filling the declared payload
  kDispatching,      // Handler running; transient within one read event
  kClosed
};

class Connection;

// Consumes readable bytes for the current state.
// Returns true if the socket may have more data, false on "would block".
using StateReadHandler = expected<bool, ErrorCode> (*)(Connection& conn);

struct StateOps {
  ConnectionState state;
  StateReadHandler on_readable;
};

// Framing limits applied to every request
struct FrameLimits {
  uint32_t max_payload_size = 64U * 1024U * 1024U;
  uint32_t frame_timeout_ms = 5000;
};

// ============================================================================
// Connection
// ============================================================================

class Connection {
 public:
  static constexpr size_t kChunkSize = 4096;

  using ConnPtr = std::shared_ptr<Connection>;

  Connection(int fd, HandlerContext& ctx, const FrameLimits& limits, ServerStats& stats);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // --- Reactor I/O ---

  // Reads and frames until the socket would block, a response is queued, or
  // the connection fails. Errors:
  //   kConnectionClosed  peer closed
  //   kSocketError       read failed
  //   kFrameParseError   peer closed mid-frame
  //   kPayloadTooLarge   declared payload over the limit
  //   kUnknownOpcode     opcode outside the protocol
  //   kInternalError     handler threw
  // The caller closes the connection on any error.
  expected<void, ErrorCode> handle_read();

  // Flushes queued response bytes. error(kSocketError) on write failure.
  expected<void, ErrorCode> handle_write();

  void close();
  bool is_closed() const;

  // While true the reactor polls for write only
  bool has_data_to_send() const { return tx_offset_ < tx_buffer_.size(); }

  // A partially received frame has been pending longer than the limit
  bool is_frame_timed_out() const;

  int get_fd() const { return socket_.handle(); }
  uint64_t get_id() const { return id_; }
  ConnectionState get_state() const { return ops_->state; }

  // Bytes committed to the payload buffer of the frame in progress
  size_t payload_capacity() const { return payload_.capacity(); }

  // Client id of the most recent complete request header
  const ClientId& last_client_id() const { return header_.client_id; }

  // --- Internal API (used by the state handlers) ---

  void transition_to_state(ConnectionState state);
  expected<bool, ErrorCode> read_header();
  expected<bool, ErrorCode> read_payload();

 private:
  uint64_t id_;
  sockpp::tcp_socket socket_;
  HandlerContext& ctx_;
  FrameLimits limits_;
  ServerStats& stats_;
  const StateOps* ops_ = nullptr;

  std::array<uint8_t, proto::kRequestHeaderSize> header_buf_{};
  size_t header_fill_ = 0;
  proto::RequestHeader header_;
  std::vector<uint8_t> payload_;
  size_t payload_fill_ = 0;

  std::vector<uint8_t> tx_buffer_;
  size_t tx_offset_ = 0;

  using SteadyClock = std::chrono::steady_clock;
  SteadyClock::time_point frame_started_at_{};

  // Reads up to len bytes. 0 on would-block, error on EOF or failure.
  expected<size_t, ErrorCode> read_some(uint8_t* dst, size_t len, bool mid_frame);
  expected<void, ErrorCode> dispatch_frame();
  void queue_response(const proto::Response& response);
};

}  // namespace mrelay

#endif  // MRELAY_CONNECTION_HPP_
