/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for ctload.
 * Provides CTLOAD_LOG_DEBUG, CTLOAD_LOG_INFO, CTLOAD_LOG_WARN, CTLOAD_LOG_ERROR.
 */

#ifndef CTLOAD_LOG_HPP_
#define CTLOAD_LOG_HPP_

#include <cstdio>
#include <cstdlib>
#include <ctime>

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace ctload {

// Leveled stderr logger. Lines from concurrent workers never interleave.
class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void set_level(Level level) { threshold().store(level, std::memory_order_relaxed); }

  static Level level() { return threshold().load(std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(threshold().load(std::memory_order_relaxed));
  }

  // Accepts "debug", "info", "warn"/"warning", "error".
  static bool parse_level(std::string_view text, Level& out) {
    if (text == "debug") {
      out = Level::kDebug;
    } else if (text == "info") {
      out = Level::kInfo;
    } else if (text == "warn" || text == "warning") {
      out = Level::kWarn;
    } else if (text == "error") {
      out = Level::kError;
    } else {
      return false;
    }
    return true;
  }

  // Applies CTLOAD_LOG_LEVEL if set and valid.
  static void init_from_env() {
    const char* env = std::getenv("CTLOAD_LOG_LEVEL");
    Level parsed;
    if (env != nullptr && parse_level(env, parsed)) {
      set_level(parsed);
    }
  }

  static void log(Level level, const std::string& msg) {
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};

    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);
    char stamp[16];
    std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d.%03d", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(millis));

    std::lock_guard<std::mutex> lock(sink_mutex());
    std::cerr << stamp << " " << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }

  static std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
  }
};

#define CTLOAD_LOG_AT(level, msg)                      \
  do {                                                 \
    if (::ctload::Logger::enabled(level)) {            \
      ::ctload::Logger::log(level, msg);               \
    }                                                  \
  } while (0)

#define CTLOAD_LOG_DEBUG(msg) CTLOAD_LOG_AT(::ctload::Logger::Level::kDebug, msg)
#define CTLOAD_LOG_INFO(msg) CTLOAD_LOG_AT(::ctload::Logger::Level::kInfo, msg)
#define CTLOAD_LOG_WARN(msg) CTLOAD_LOG_AT(::ctload::Logger::Level::kWarn, msg)
#define CTLOAD_LOG_ERROR(msg) CTLOAD_LOG_AT(::ctload::Logger::Level::kError, msg)

}  // namespace ctload

#endif  // CTLOAD_LOG_HPP_
