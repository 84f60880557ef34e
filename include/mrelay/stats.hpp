/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef MRELAY_STATS_HPP_
#define MRELAY_STATS_HPP_

#include <atomic>
#include <cstdint>

namespace mrelay {

// ============================================================================
// ServerStats - Atomic counters, readable from any thread
// ============================================================================

struct ServerStats {
  // Connection counters
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> rejected_connections{0};

  // Request counters
  std::atomic<uint64_t> requests_handled{0};
  std::atomic<uint64_t> error_responses{0};

  // Error counters
  std::atomic<uint64_t> framing_errors{0};
  std::atomic<uint64_t> socket_errors{0};

  // Throughput
  std::atomic<uint64_t> bytes_in{0};
  std::atomic<uint64_t> bytes_out{0};

  // Latency tracking (microseconds)
  std::atomic<uint64_t> last_poll_latency_us{0};
  std::atomic<uint64_t> max_poll_latency_us{0};

  void reset() {
    total_connections = 0;
    active_connections = 0;
    rejected_connections = 0;
    requests_handled = 0;
    error_responses = 0;
    framing_errors = 0;
    socket_errors = 0;
    bytes_in = 0;
    bytes_out = 0;
    last_poll_latency_us = 0;
    max_poll_latency_us = 0;
  }
};

}  // namespace mrelay

#endif  // MRELAY_STATS_HPP_
