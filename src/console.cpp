/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "mrelay/console.hpp"

#include "mrelay/log.hpp"

#include <cctype>

#include <string>

namespace mrelay {

bool is_quit_command(std::string_view line) {
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) line.remove_prefix(1);
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.remove_suffix(1);
  return line.size() == 1 && std::tolower(static_cast<unsigned char>(line[0])) == 'q';
}

bool run_shutdown_listener(std::istream& in, const std::function<void()>& on_quit) {
  std::string line;
  while (std::getline(in, line)) {
    if (is_quit_command(line)) {
      MRELAY_LOG_INFO("Shutdown requested from console");
      if (on_quit) {
        on_quit();
      }
      return true;
    }
  }
  MRELAY_LOG_INFO("Console input closed, shutdown listener exiting");
  return false;
}

}  // namespace mrelay
