// Repository: Reprise
// Component: Session Configuration
// Purpose: Tunables for recovery, completion, persistence and notification.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_CONFIG_SESSION_CONFIG_HPP_
#define REPRISE_CONFIG_SESSION_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

namespace reprise::config {

struct SessionConfig {
  // Retry budget per session; never reset mid-session.
  int max_retries = 3;
  int64_t retry_delay_ms = 2000;

  // A terminal engine state is trusted only this close to the end.
  int64_t end_epsilon_ms = 1000;
  // Parse and generic errors this close to the end count as completion.
  int64_t near_end_window_ms = 5000;
  // Successive parse errors closer than this are a retry loop.
  int64_t loop_window_ms = 10000;
  int64_t mid_stream_skip_ms = 5000;
  int64_t loop_skip_ms = 15000;
  double tail_skip_fraction = 0.999;

  int64_t heartbeat_interval_ms = 1000;
  int64_t resume_save_interval_ms = 5000;
  // Periodic saves stop at this watched percentage.
  int resume_save_ceiling_percent = 95;

  int64_t movie_grace_ms = 1500;
  int64_t advance_notify_wait_ms = 1500;

  int rpc_timeout_ms = 4000;
  size_t max_pending_messages = 64;

  // Caller wants a structured SessionResult on termination.
  bool expect_result = false;

  // Returns defaults overlaid with REPRISE_* environment variables.
  // Malformed values are skipped with a warning.
  static SessionConfig FromEnvironment();
};

}  // namespace reprise::config

#endif  // REPRISE_CONFIG_SESSION_CONFIG_HPP_
