/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "mrelay/config.hpp"

#include "mrelay/log.hpp"

#include <cctype>

#include <fstream>
#include <sstream>

namespace mrelay {

uint16_t load_port(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    MRELAY_LOG_WARN("Port file " + path + " not found. Using default port " + std::to_string(kDefaultPort) + ".");
    return kDefaultPort;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  std::string text = buffer.str();

  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

  if (begin == end) {
    MRELAY_LOG_WARN("Port file " + path + " is empty. Using default port " + std::to_string(kDefaultPort) + ".");
    return kDefaultPort;
  }

  uint32_t value = 0;
  for (size_t i = begin; i < end; ++i) {
    const char c = text[i];
    if (!std::isdigit(static_cast<unsigned char>(c)) || value > 65535) {
      MRELAY_LOG_WARN("Invalid port in " + path + ". Using default port " + std::to_string(kDefaultPort) + ".");
      return kDefaultPort;
    }
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }

  if (value == 0 || value > 65535) {
    MRELAY_LOG_WARN("Port " + std::to_string(value) + " out of range. Using default port " +
                    std::to_string(kDefaultPort) + ".");
    return kDefaultPort;
  }
  return static_cast<uint16_t>(value);
}

bool parse_command_line(int argc, const char* const argv[], ServerConfig& config) {
  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (!arg.empty() && arg[0] == '-') {
      return false;
    } else if (positional == 0) {
      config.port_file = arg;
      ++positional;
    } else if (positional == 1) {
      config.db_path = arg;
      ++positional;
    } else {
      return false;
    }
  }
  return true;
}

}  // namespace mrelay
