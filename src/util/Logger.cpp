// Repository: Reprise
// Component: Thread-Safe Logger
// Purpose: Leveled, mutex-protected log emission shared by the controller and its workers.
// Copyright (c) 2026 Reprise

#include "reprise/util/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace reprise::util {

namespace {

LogLevel InitialLevel() {
  if (const char* raw = std::getenv("REPRISE_LOG_LEVEL")) {
    if (auto parsed = ParseLogLevel(raw)) return *parsed;
  }
  if (std::getenv("REPRISE_DEBUG") != nullptr) return LogLevel::kDebug;
  return LogLevel::kInfo;
}

std::atomic<int>& Threshold() {
  static std::atomic<int> threshold{static_cast<int>(InitialLevel())};
  return threshold;
}

std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}

// Guarded by OutputMutex().
Logger::Sink& CaptureSink() {
  static Logger::Sink sink;
  return sink;
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "debug";
    case LogLevel::kInfo: return "info";
    case LogLevel::kWarn: return "warn";
    case LogLevel::kError: return "error";
  }
  return "unknown";
}

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (LogLevel level : {LogLevel::kDebug, LogLevel::kInfo, LogLevel::kWarn, LogLevel::kError}) {
    if (lower == LogLevelName(level)) return level;
  }
  return std::nullopt;
}

void Logger::Write(LogLevel level, const std::string& line) {
  if (static_cast<int>(level) < Threshold().load(std::memory_order_relaxed)) return;
  std::lock_guard<std::mutex> lock(OutputMutex());
  if (CaptureSink()) CaptureSink()(level, line);
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

void Logger::SetMinLevel(LogLevel level) {
  Threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::MinLevel() {
  return static_cast<LogLevel>(Threshold().load(std::memory_order_relaxed));
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(OutputMutex());
  CaptureSink() = std::move(sink);
}

}  // namespace reprise::util
