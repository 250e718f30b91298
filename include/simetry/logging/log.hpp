#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

// namespace logging: diagnostics for sessions and connectors.
// One line per event on stderr: "HH:MM:SS LEVEL [tag] message". Lines are
// assembled first and written under a mutex so that the reactor thread and
// the caller's thread do not interleave.
namespace simetry::logging {

enum class Level { info = 0, warn = 1, error = 2, off = 3 };

namespace detail {

inline std::atomic<Level> &MinLevel() {
  static std::atomic<Level> level{Level::info};
  return level;
}

inline std::mutex &SinkMutex() {
  static std::mutex m;
  return m;
}

// HH:MM:SS of the local clock
inline std::string ClockTime() {
  const std::time_t tt =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S");
  return oss.str();
}

inline const char *LevelName(Level level) {
  switch (level) {
  case Level::info:
    return "INFO";
  case Level::warn:
    return "WARN";
  case Level::error:
    return "ERROR";
  default:
    return "";
  }
}

template <typename... Args>
void Write(Level level, std::string_view tag, const Args &...args) {
  if (level < MinLevel().load(std::memory_order_relaxed)) {
    return;
  }
  std::ostringstream line;
  line << ClockTime() << ' ' << LevelName(level) << " [" << tag << "] ";
  (line << ... << args);
  line << '\n';
  std::lock_guard lock(SinkMutex());
  std::cerr << line.str();
}

} // namespace detail

inline void SetLevel(Level level) {
  detail::MinLevel().store(level, std::memory_order_relaxed);
}

template <typename... Args>
void Info(std::string_view tag, const Args &...args) {
  detail::Write(Level::info, tag, args...);
}

template <typename... Args>
void Warn(std::string_view tag, const Args &...args) {
  detail::Write(Level::warn, tag, args...);
}

template <typename... Args>
void Error(std::string_view tag, const Args &...args) {
  detail::Write(Level::error, tag, args...);
}

} // namespace simetry::logging
