/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for EDIAM (loghelper-compatible interface).
 * Provides EDIAM_LOG_DEBUG, EDIAM_LOG_INFO, EDIAM_LOG_WARN, EDIAM_LOG_ERROR
 * macros.
 */

#ifndef EDIAM_LOG_HPP_
#define EDIAM_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace ediam {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void log(Level level, const std::string& msg) {
    if (!enabled(level)) {
      return;
    }
    static const char* prefix[] = {"[EDIAM DEBUG]", "[EDIAM INFO]", "[EDIAM WARN]",
                                   "[EDIAM ERROR]"};
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

  static void set_level(Level level) { threshold().store(static_cast<int>(level)); }

  static Level level() { return static_cast<Level>(threshold().load()); }

  static bool enabled(Level level) { return static_cast<int>(level) >= threshold().load(); }

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

#define EDIAM_LOG_DEBUG(msg)                                        \
  do {                                                              \
    if (::ediam::Logger::enabled(::ediam::Logger::Level::kDebug)) { \
      ::ediam::Logger::log(::ediam::Logger::Level::kDebug, msg);    \
    }                                                               \
  } while (0)
#define EDIAM_LOG_INFO(msg) ::ediam::Logger::log(::ediam::Logger::Level::kInfo, msg)
#define EDIAM_LOG_WARN(msg) ::ediam::Logger::log(::ediam::Logger::Level::kWarn, msg)
#define EDIAM_LOG_ERROR(msg) ::ediam::Logger::log(::ediam::Logger::Level::kError, msg)

}  // namespace ediam

#endif  // EDIAM_LOG_HPP_
