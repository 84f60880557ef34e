/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef MRELAY_CONSOLE_HPP_
#define MRELAY_CONSOLE_HPP_

#include <functional>
#include <istream>
#include <string_view>

namespace mrelay {

// True for "q" in any case, ignoring surrounding whitespace
bool is_quit_command(std::string_view line);

// Reads operator commands line by line. Calls on_quit and returns true on a
// quit command; returns false on end of input without calling it.
bool run_shutdown_listener(std::istream& in, const std::function<void()>& on_quit);

}  // namespace mrelay

#endif  // MRELAY_CONSOLE_HPP_
