/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "mrelay/connection.hpp"

#include "mrelay/log.hpp"

#include <cerrno>

#include <algorithm>
#include <exception>
#include <string>
#include <sys/socket.h>

namespace mrelay {

// --- State handler functions ---

namespace detail {

inline expected<bool, ErrorCode> header_on_readable(Connection& conn) { return conn.read_header(); }

inline expected<bool, ErrorCode> payload_on_readable(Connection& conn) { return conn.read_payload(); }

// Reached only if a handler re-enters the connection
inline expected<bool, ErrorCode> dispatching_on_readable(Connection&) {
  return expected<bool, ErrorCode>::success(false);
}

inline expected<bool, ErrorCode> closed_on_readable(Connection&) {
  return expected<bool, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

}  // namespace detail

// State operation tables (const, zero allocation)
static const StateOps kAwaitingHeaderOps = {ConnectionState::kAwaitingHeader, detail::header_on_readable};
static const StateOps kAwaitingPayloadOps = {ConnectionState::kAwaitingPayload, detail::payload_on_readable};
static const StateOps kDispatchingOps = {ConnectionState::kDispatching, detail::dispatching_on_readable};
static const StateOps kClosedOps = {ConnectionState::kClosed, detail::closed_on_readable};

static uint64_t g_next_conn_id = 1;

Connection::Connection(int fd, HandlerContext& ctx, const FrameLimits& limits, ServerStats& stats)
    : id_(g_next_conn_id++), socket_(fd), ctx_(ctx), limits_(limits), stats_(stats) {
  if (!socket_.set_non_blocking(true)) {
    MRELAY_LOG_WARN("Connection " + std::to_string(id_) + ": could not set non-blocking mode");
  }
  ops_ = &kAwaitingHeaderOps;
}

Connection::~Connection() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

void Connection::transition_to_state(ConnectionState state) {
  switch (state) {
    case ConnectionState::kAwaitingHeader:
      ops_ = &kAwaitingHeaderOps;
      header_fill_ = 0;
      break;
    case ConnectionState::kAwaitingPayload:
      ops_ = &kAwaitingPayloadOps;
      payload_fill_ = 0;
      break;
    case ConnectionState::kDispatching:
      ops_ = &kDispatchingOps;
      break;
    case ConnectionState::kClosed:
      ops_ = &kClosedOps;
      break;
  }
}

expected<void, ErrorCode> Connection::handle_read() {
  while (!has_data_to_send()) {
    auto result = ops_->on_readable(*this);
    if (!result.has_value()) {
      return expected<void, ErrorCode>::error(result.get_error());
    }
    if (!result.value()) {
      break;
    }
  }
  return expected<void, ErrorCode>::success();
}

expected<size_t, ErrorCode> Connection::read_some(uint8_t* dst, size_t len, bool mid_frame) {
  auto res = socket_.read(dst, len);
  if (!res) {
    int err = res.error().value();
    if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
      return expected<size_t, ErrorCode>::success(0);
    }
    MRELAY_LOG_ERROR("Connection " + std::to_string(id_) + ": read error: " + res.error().message());
    return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
  }
  if (res.value() == 0) {
    return expected<size_t, ErrorCode>::error(mid_frame ? ErrorCode::kFrameParseError
                                                        : ErrorCode::kConnectionClosed);
  }
  stats_.bytes_in.fetch_add(res.value(), std::memory_order_relaxed);
  return expected<size_t, ErrorCode>::success(res.value());
}

expected<bool, ErrorCode> Connection::read_header() {
  const bool mid_frame = header_fill_ > 0;
  auto n = read_some(header_buf_.data() + header_fill_, header_buf_.size() - header_fill_, mid_frame);
  if (!n.has_value()) {
    if (n.get_error() == ErrorCode::kFrameParseError) {
      MRELAY_LOG_ERROR("Connection " + std::to_string(id_) + ": incomplete header (" +
                       std::to_string(header_fill_) + " of " + std::to_string(proto::kRequestHeaderSize) +
                       " bytes)");
    }
    return expected<bool, ErrorCode>::error(n.get_error());
  }
  if (n.value() == 0) {
    return expected<bool, ErrorCode>::success(false);
  }

  if (header_fill_ == 0) {
    frame_started_at_ = SteadyClock::now();
  }
  header_fill_ += n.value();
  if (header_fill_ < header_buf_.size()) {
    return expected<bool, ErrorCode>::success(true);
  }

  auto parsed = proto::parse_request_header(header_buf_.data(), header_buf_.size());
  if (!parsed.has_value()) {
    return expected<bool, ErrorCode>::error(parsed.get_error());
  }
  header_ = parsed.value();

  if (header_.payload_size > limits_.max_payload_size) {
    MRELAY_LOG_ERROR("Connection " + std::to_string(id_) + ": declared payload of " +
                     std::to_string(header_.payload_size) + " bytes exceeds limit");
    return expected<bool, ErrorCode>::error(ErrorCode::kPayloadTooLarge);
  }

  // Grown as bytes arrive; a stalled peer commits at most one chunk
  payload_.clear();
  payload_.reserve(std::min(kChunkSize, static_cast<size_t>(header_.payload_size)));
  transition_to_state(ConnectionState::kAwaitingPayload);
  if (header_.payload_size == 0) {
    auto dispatched = dispatch_frame();
    if (!dispatched.has_value()) {
      return expected<bool, ErrorCode>::error(dispatched.get_error());
    }
  }
  return expected<bool, ErrorCode>::success(true);
}

expected<bool, ErrorCode> Connection::read_payload() {
  const size_t expected_size = header_.payload_size;
  const size_t want = std::min(kChunkSize, expected_size - payload_fill_);
  payload_.resize(payload_fill_ + want);
  auto n = read_some(payload_.data() + payload_fill_, want, true);
  if (!n.has_value()) {
    if (n.get_error() == ErrorCode::kFrameParseError) {
      MRELAY_LOG_ERROR("Connection " + std::to_string(id_) + ": peer closed after " +
                       std::to_string(payload_fill_) + " of " + std::to_string(expected_size) +
                       " payload bytes");
    }
    return expected<bool, ErrorCode>::error(n.get_error());
  }
  payload_fill_ += n.value();
  payload_.resize(payload_fill_);
  if (n.value() == 0) {
    return expected<bool, ErrorCode>::success(false);
  }

  if (payload_fill_ == expected_size) {
    auto dispatched = dispatch_frame();
    if (!dispatched.has_value()) {
      return expected<bool, ErrorCode>::error(dispatched.get_error());
    }
  }
  return expected<bool, ErrorCode>::success(true);
}

expected<void, ErrorCode> Connection::dispatch_frame() {
  transition_to_state(ConnectionState::kDispatching);

  proto::Request request;
  request.header = header_;
  request.payload = std::move(payload_);
  payload_.clear();

  try {
    auto result = dispatch(request, ctx_);
    if (!result.has_value()) {
      MRELAY_LOG_ERROR("Connection " + std::to_string(id_) + ": unknown opcode " +
                       std::to_string(header_.opcode));
      return expected<void, ErrorCode>::error(result.get_error());
    }

    queue_response(result.value());
    stats_.requests_handled.fetch_add(1, std::memory_order_relaxed);
    if (result.value().is_error()) {
      stats_.error_responses.fetch_add(1, std::memory_order_relaxed);
    }

    auto touched = ctx_.store.update_last_seen(header_.client_id);
    if (!touched.has_value()) {
      MRELAY_LOG_WARN("Failed to update last seen for " + to_hex(header_.client_id) + ": " +
                      to_string(touched.get_error()));
    }
  } catch (const std::exception& e) {
    MRELAY_LOG_ERROR("Connection " + std::to_string(id_) + ": handler failed: " + e.what());
    return expected<void, ErrorCode>::error(ErrorCode::kInternalError);
  }

  transition_to_state(ConnectionState::kAwaitingHeader);
  return expected<void, ErrorCode>::success();
}

void Connection::queue_response(const proto::Response& response) {
  if (!has_data_to_send()) {
    tx_buffer_.clear();
    tx_offset_ = 0;
  }
  auto frame = proto::encode_response(response);
  tx_buffer_.insert(tx_buffer_.end(), frame.begin(), frame.end());
}

expected<void, ErrorCode> Connection::handle_write() {
  while (has_data_to_send()) {
    auto res = socket_.send(tx_buffer_.data() + tx_offset_, tx_buffer_.size() - tx_offset_, MSG_NOSIGNAL);
    if (!res) {
      int err = res.error().value();
      if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
        break;
      }
      MRELAY_LOG_ERROR("Connection " + std::to_string(id_) + ": write error: " + res.error().message());
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
    tx_offset_ += res.value();
    stats_.bytes_out.fetch_add(res.value(), std::memory_order_relaxed);
  }

  if (!has_data_to_send()) {
    tx_buffer_.clear();
    tx_offset_ = 0;
  }
  return expected<void, ErrorCode>::success();
}

void Connection::close() {
  if (get_state() == ConnectionState::kClosed) {
    return;
  }
  transition_to_state(ConnectionState::kClosed);
  socket_.close();
}

bool Connection::is_closed() const { return !socket_.is_open() || get_state() == ConnectionState::kClosed; }

bool Connection::is_frame_timed_out() const {
  const bool mid_frame = (get_state() == ConnectionState::kAwaitingHeader && header_fill_ > 0) ||
                         get_state() == ConnectionState::kAwaitingPayload;
  if (!mid_frame) {
    return false;
  }
  auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - frame_started_at_).count();
  return elapsed > static_cast<int64_t>(limits_.frame_timeout_ms);
}

}  // namespace mrelay
