/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for mrelay.
 * Provides MRELAY_LOG_INFO, MRELAY_LOG_WARN, MRELAY_LOG_ERROR, MRELAY_LOG_DEBUG.
 */

#ifndef MRELAY_LOG_HPP_
#define MRELAY_LOG_HPP_

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

namespace mrelay {

// Line-oriented stderr logger. The console thread and the reactor both log,
// so each line is written under one lock.
class Logger {
 public:
  enum class Level { kInfo, kWarn, kError, kDebug };

  static void log(Level level, const std::string& msg) {
    const char* names[] = {"INFO", "WARNING", "ERROR", "DEBUG"};
    if (level == Level::kDebug && !debug_enabled()) {
      return;
    }

    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local_tm);

    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << stamp << " - " << names[static_cast<int>(level)] << " - " << msg << std::endl;
  }

  static bool debug_enabled() { return debug_flag().load(std::memory_order_relaxed); }
  static void set_debug(bool enabled) { debug_flag().store(enabled, std::memory_order_relaxed); }

 private:
  static std::atomic<bool>& debug_flag() {
    static std::atomic<bool> enabled{false};
    return enabled;
  }

  static std::mutex& mutex() {
    static std::mutex m;
    return m;
  }
};

#define MRELAY_LOG_INFO(msg) ::mrelay::Logger::log(::mrelay::Logger::Level::kInfo, msg)
#define MRELAY_LOG_WARN(msg) ::mrelay::Logger::log(::mrelay::Logger::Level::kWarn, msg)
#define MRELAY_LOG_ERROR(msg) ::mrelay::Logger::log(::mrelay::Logger::Level::kError, msg)
#define MRELAY_LOG_DEBUG(msg) ::mrelay::Logger::log(::mrelay::Logger::Level::kDebug, msg)

}  // namespace mrelay

#endif  // MRELAY_LOG_HPP_
