// Repository: Reprise
// Component: Session Configuration
// Purpose: Environment overlay for SessionConfig.
// Copyright (c) 2026 Reprise

#include "reprise/config/SessionConfig.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

#include "reprise/util/Logger.hpp"

namespace reprise::config {

namespace {

constexpr int64_t kIntMax = std::numeric_limits<int>::max();

bool ReadEnvInt64(const char* name, int64_t min_value, int64_t* out,
                  int64_t max_value = std::numeric_limits<int64_t>::max()) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') return false;
  try {
    size_t used = 0;
    const long long v = std::stoll(raw, &used);
    if (used != std::string(raw).size() || v < min_value || v > max_value) {
      util::Logger::Warn(std::string("[SessionConfig] ignoring ") + name + "=" + raw);
      return false;
    }
    *out = static_cast<int64_t>(v);
    return true;
  } catch (const std::invalid_argument&) {
  } catch (const std::out_of_range&) {
  }
  util::Logger::Warn(std::string("[SessionConfig] ignoring ") + name + "=" + raw);
  return false;
}

bool ReadEnvDouble(const char* name, double* out) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') return false;
  try {
    size_t used = 0;
    const double v = std::stod(raw, &used);
    if (used == std::string(raw).size() && v > 0.0 && v < 1.0) {
      *out = v;
      return true;
    }
  } catch (const std::invalid_argument&) {
  } catch (const std::out_of_range&) {
  }
  util::Logger::Warn(std::string("[SessionConfig] ignoring ") + name + "=" + raw);
  return false;
}

}  // namespace

SessionConfig SessionConfig::FromEnvironment() {
  SessionConfig config;
  int64_t v = 0;
  if (ReadEnvInt64("REPRISE_MAX_RETRIES", 0, &v, kIntMax)) {
    config.max_retries = static_cast<int>(v);
  }
  if (ReadEnvInt64("REPRISE_RETRY_DELAY_MS", 0, &v)) config.retry_delay_ms = v;
  if (ReadEnvInt64("REPRISE_END_EPSILON_MS", 0, &v)) config.end_epsilon_ms = v;
  if (ReadEnvInt64("REPRISE_NEAR_END_WINDOW_MS", 0, &v)) config.near_end_window_ms = v;
  if (ReadEnvInt64("REPRISE_LOOP_WINDOW_MS", 0, &v)) config.loop_window_ms = v;
  if (ReadEnvInt64("REPRISE_MID_STREAM_SKIP_MS", 0, &v)) config.mid_stream_skip_ms = v;
  if (ReadEnvInt64("REPRISE_LOOP_SKIP_MS", 0, &v)) config.loop_skip_ms = v;
  ReadEnvDouble("REPRISE_TAIL_SKIP_FRACTION", &config.tail_skip_fraction);
  if (ReadEnvInt64("REPRISE_HEARTBEAT_INTERVAL_MS", 1, &v)) config.heartbeat_interval_ms = v;
  if (ReadEnvInt64("REPRISE_RESUME_SAVE_INTERVAL_MS", 1, &v)) config.resume_save_interval_ms = v;
  if (ReadEnvInt64("REPRISE_MOVIE_GRACE_MS", 0, &v)) config.movie_grace_ms = v;
  if (ReadEnvInt64("REPRISE_ADVANCE_NOTIFY_WAIT_MS", 0, &v)) config.advance_notify_wait_ms = v;
  if (ReadEnvInt64("REPRISE_RPC_TIMEOUT_MS", 1, &v, kIntMax)) {
    config.rpc_timeout_ms = static_cast<int>(v);
  }
  return config;
}

}  // namespace reprise::config
