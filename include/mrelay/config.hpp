/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef MRELAY_CONFIG_HPP_
#define MRELAY_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

#include <string>

namespace mrelay {

static constexpr uint16_t kDefaultPort = 1357;
static constexpr const char* kDefaultPortFile = "myport.info";
static constexpr const char* kDefaultDbFile = "defensive.db";

// ============================================================================
// Server configuration
// ============================================================================

struct ServerConfig {
  uint16_t port = kDefaultPort;
  std::string bind_addr;               // Empty: all interfaces
  size_t max_connections = 100;        // Active connections before rejecting
  int backlog = 100;                   // listen() backlog
  int poll_timeout_ms = 1000;          // Upper bound on stop() latency
  uint32_t frame_timeout_ms = 5000;    // Max time to complete one request frame
  uint32_t max_payload_size = 64U * 1024U * 1024U;
  std::string db_path = kDefaultDbFile;
  std::string port_file = kDefaultPortFile;
  bool verbose = false;                // Also log per-request DEBUG lines
};

// Parses `[-v] [port_file] [db_file]` into config. Returns false on an
// unknown option or extra positional argument.
bool parse_command_line(int argc, const char* const argv[], ServerConfig& config);

// Reads the listening port from a one-line file. Missing, empty,
// non-numeric or out-of-range (not 1..65535) content logs a warning and
// yields kDefaultPort.
uint16_t load_port(const std::string& path);

}  // namespace mrelay

#endif  // MRELAY_CONFIG_HPP_
