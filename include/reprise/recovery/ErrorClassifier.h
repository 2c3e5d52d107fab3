// Repository: Reprise
// Component: Error Classifier
// Purpose: Priority-ordered classification of engine errors into recovery verdicts.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_RECOVERY_ERROR_CLASSIFIER_H_
#define REPRISE_RECOVERY_ERROR_CLASSIFIER_H_

#include <cstdint>
#include <optional>
#include <string>

#include "reprise/config/SessionConfig.hpp"
#include "reprise/engine/IMediaEngine.h"
#include "reprise/session/Session.hpp"

namespace reprise::recovery {

enum class ErrorKind {
  kNone,
  kNetwork,
  kNearEndFormat,
  kRetryLoop,
  kMidStreamFormat,
  kGenericNearEnd,
  kMaxRetriesExceeded,
  kFatal,
};

const char* ErrorKindName(ErrorKind kind);

// Per-session retry bookkeeping. Owned by the controller and mutated only
// on its serial queue; reset when a new session starts.
struct RetryState {
  int attempts = 0;
  ErrorKind last_error_kind = ErrorKind::kNone;
  std::optional<int64_t> last_error_position_ms;
  // Position of the most recent parse/format error, for loop detection.
  std::optional<int64_t> last_parse_error_position_ms;
  bool loop_suspected = false;
  // The skip-to-tail mitigation is spent at most once per session.
  bool tail_skip_used = false;

  void Reset() { *this = RetryState{}; }
};

// Set at most once per session and never cleared. A fresh guard comes with
// each session.
class CompletionGuard {
 public:
  // True for the first caller only.
  bool TryAcquire() {
    if (handled_) return false;
    handled_ = true;
    return true;
  }
  [[nodiscard]] bool handled() const { return handled_; }

 private:
  bool handled_ = false;
};

enum class Verdict {
  kRetryable,
  kTreatAsCompletion,
  kFatal,
};

const char* VerdictName(Verdict verdict);

struct Classification {
  Verdict verdict = Verdict::kFatal;
  ErrorKind kind = ErrorKind::kFatal;
  // Resume position for kRetryable.
  int64_t retry_target_ms = 0;
  // This error's position converged on the previous parse error.
  bool loop_detected = false;
  std::string reason;
};

[[nodiscard]] bool IsParseError(const engine::EngineError& error);
[[nodiscard]] bool IsNetworkError(const engine::EngineError& error);

// Rules, first match wins:
//   1. parse error near the end, no loop          -> completion
//   2. parse error near the end, loop             -> skip to tail once, else completion
//   3. parse error mid-stream                     -> progressive skip, else fatal
//   4. any error near the end                     -> completion
//   5. network error                              -> retry at error position, else exhausted
//   6. anything else                              -> fatal
// Pure function: the caller applies the result to RetryState.
Classification ClassifyError(const engine::EngineError& error,
                             const session::PlaybackSnapshot& at_error,
                             const RetryState& state,
                             const config::SessionConfig& config);

}  // namespace reprise::recovery

#endif  // REPRISE_RECOVERY_ERROR_CLASSIFIER_H_
