// Repository: Reprise
// Component: Thread-Safe Logger
// Purpose: Leveled, mutex-protected log emission shared by the controller and its workers.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_UTIL_LOGGER_HPP_
#define REPRISE_UTIL_LOGGER_HPP_

#include <functional>
#include <optional>
#include <string>

namespace reprise::util {

enum class LogLevel {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
};

const char* LogLevelName(LogLevel level);
// Accepts "debug", "info", "warn", "error" (any case).
std::optional<LogLevel> ParseLogLevel(const std::string& name);

// Logger writes whole lines under one process-wide mutex so output from the
// serial executor, the notifier sender and the resume writer never
// interleaves. Debug and Info go to stdout, Warn and Error to stderr.
//
// Lines below the threshold are discarded before taking the lock. The
// initial threshold comes from REPRISE_LOG_LEVEL; REPRISE_DEBUG alone
// lowers it to debug. Default is info.
//
// Callers prefix lines with their component tag, e.g. "[ResumeStore] ".
class Logger {
 public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static void Debug(const std::string& line) { Write(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Write(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Write(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Write(LogLevel::kError, line); }

  static void Write(LogLevel level, const std::string& line);

  static void SetMinLevel(LogLevel level);
  static LogLevel MinLevel();

  // Test hook: receives every line that passes the threshold, in addition
  // to the stream. nullptr removes it.
  static void SetSink(Sink sink);
};

}  // namespace reprise::util

#endif  // REPRISE_UTIL_LOGGER_HPP_
