#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string_view>

#include <sys/types.h>

namespace hmon {

enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

// Line-oriented logger, safe to share between threads. Defaults to stderr:
// stdout is reserved for the JSON-RPC channel.
class Logger {
public:
  explicit Logger(std::ostream& out = std::cerr, LogLevel min_level = LogLevel::Info);

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel level() const;

  void debug(std::string_view msg) { log(LogLevel::Debug, msg); }
  void info(std::string_view msg) { log(LogLevel::Info, msg); }
  void warn(std::string_view msg) { log(LogLevel::Warn, msg); }
  void error(std::string_view msg) { log(LogLevel::Error, msg); }

  static std::string_view level_to_string(LogLevel level);
  // Unrecognized names map to Info.
  static LogLevel level_from_string(std::string_view name);

private:
  void log(LogLevel level, std::string_view msg);

  std::ostream& out_;
  std::atomic<LogLevel> min_level_;
  pid_t pid_;
  std::mutex mutex_;
};

} // namespace hmon
