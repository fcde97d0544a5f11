/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for micbridge (loghelper-compatible interface).
 * Provides MICBRIDGE_LOG_INFO, MICBRIDGE_LOG_WARN, MICBRIDGE_LOG_ERROR,
 * MICBRIDGE_LOG_DEBUG macros.
 */

#ifndef MICBRIDGE_LOG_HPP_
#define MICBRIDGE_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace micbridge {

// Process-wide stderr logger. Lines from the reactor and pipeline threads are
// serialized; messages below the configured level are not formatted at all.
class Logger {
 public:
  enum class Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

  static void set_level(Level level) { threshold().store(static_cast<int>(level), std::memory_order_relaxed); }

  static Level level() { return static_cast<Level>(threshold().load(std::memory_order_relaxed)); }

  static bool enabled(Level level) {
    return static_cast<int>(level) <= threshold().load(std::memory_order_relaxed);
  }

  static void log(Level level, const std::string& msg) {
    const char* prefix[] = {"[ERROR]", "[WARN]", "[INFO]", "[DEBUG]"};
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[micbridge] " << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static std::atomic<int>& threshold() {
    static std::atomic<int> value{static_cast<int>(Level::kInfo)};
    return value;
  }

  static std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
  }
};

#define MICBRIDGE_LOG_AT(lvl, msg)                  \
  do {                                              \
    if (::micbridge::Logger::enabled(lvl)) {        \
      ::micbridge::Logger::log(lvl, msg);           \
    }                                               \
  } while (0)

#define MICBRIDGE_LOG_INFO(msg) MICBRIDGE_LOG_AT(::micbridge::Logger::Level::kInfo, msg)
#define MICBRIDGE_LOG_WARN(msg) MICBRIDGE_LOG_AT(::micbridge::Logger::Level::kWarn, msg)
#define MICBRIDGE_LOG_ERROR(msg) MICBRIDGE_LOG_AT(::micbridge::Logger::Level::kError, msg)
#define MICBRIDGE_LOG_DEBUG(msg) MICBRIDGE_LOG_AT(::micbridge::Logger::Level::kDebug, msg)

}  // namespace micbridge

#endif  // MICBRIDGE_LOG_HPP_
