// Repository: Reprise
// Component: Error Classifier
// Purpose: Priority-ordered classification of engine errors into recovery verdicts.
// Copyright (c) 2026 Reprise

#include "reprise/recovery/ErrorClassifier.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>

namespace reprise::recovery {

namespace {

using engine::EngineErrorCode;

std::string LowerText(const engine::EngineError& error) {
  std::string text = error.message + " " + error.cause;
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool ContainsAny(const std::string& text, std::initializer_list<const char*> needles) {
  for (const char* n : needles) {
    if (text.find(n) != std::string::npos) return true;
  }
  return false;
}

int64_t TailTarget(int64_t duration_ms, double fraction) {
  return static_cast<int64_t>(static_cast<double>(duration_ms) * fraction);
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone: return "None";
    case ErrorKind::kNetwork: return "NetworkError";
    case ErrorKind::kNearEndFormat: return "NearEndFormatError";
    case ErrorKind::kRetryLoop: return "RetryLoopDetected";
    case ErrorKind::kMidStreamFormat: return "MidStreamFormatError";
    case ErrorKind::kGenericNearEnd: return "GenericNearEnd";
    case ErrorKind::kMaxRetriesExceeded: return "MaxRetriesExceeded";
    case ErrorKind::kFatal: return "Fatal";
  }
  return "Unknown";
}

const char* VerdictName(Verdict verdict) {
  switch (verdict) {
    case Verdict::kRetryable: return "Retryable";
    case Verdict::kTreatAsCompletion: return "TreatAsCompletion";
    case Verdict::kFatal: return "Fatal";
  }
  return "Unknown";
}

bool IsParseError(const engine::EngineError& error) {
  switch (error.code) {
    case EngineErrorCode::kContainerMalformed:
    case EngineErrorCode::kContainerUnsupported:
    case EngineErrorCode::kSubtitleMalformed:
      return true;
    case EngineErrorCode::kUnspecified:
      return ContainsAny(LowerText(error), {"parse", "parser", "malformed", "demux"});
    default:
      return false;
  }
}

bool IsNetworkError(const engine::EngineError& error) {
  switch (error.code) {
    case EngineErrorCode::kIoUnspecified:
    case EngineErrorCode::kNetworkConnectionFailed:
    case EngineErrorCode::kNetworkTimeout:
    case EngineErrorCode::kConnectionReset:
    case EngineErrorCode::kDnsFailure:
    case EngineErrorCode::kBadHttpStatus:
      return true;
    case EngineErrorCode::kUnspecified:
      return ContainsAny(LowerText(error),
                         {"connection reset", "timed out", "timeout", "unable to resolve host",
                          "dns", "network", "i/o", "socket", "broken pipe"});
    default:
      return false;
  }
}

Classification ClassifyError(const engine::EngineError& error,
                             const session::PlaybackSnapshot& at_error,
                             const RetryState& state,
                             const config::SessionConfig& config) {
  Classification c;
  const int64_t position = at_error.position_ms;
  const auto remaining = at_error.RemainingMs();
  const bool near_end = remaining && *remaining <= config.near_end_window_ms;
  const bool budget_left = state.attempts < config.max_retries;

  if (IsParseError(error)) {
    c.loop_detected = state.last_parse_error_position_ms &&
                      std::llabs(position - *state.last_parse_error_position_ms) <=
                          config.loop_window_ms;

    if (near_end && !c.loop_detected) {
      c.verdict = Verdict::kTreatAsCompletion;
      c.kind = ErrorKind::kNearEndFormat;
      c.reason = "parse error " + std::to_string(*remaining) + "ms before end";
      return c;
    }

    if (near_end) {
      c.kind = ErrorKind::kRetryLoop;
      if (budget_left && !state.tail_skip_used) {
        c.verdict = Verdict::kRetryable;
        c.retry_target_ms = TailTarget(at_error.duration_ms, config.tail_skip_fraction);
        c.reason = "parse errors converging near end, skipping to tail";
      } else {
        c.verdict = Verdict::kTreatAsCompletion;
        c.reason = "corrupt tail persists, treating as completion";
      }
      return c;
    }

    const bool loop = c.loop_detected || state.loop_suspected;
    const int64_t skip = loop ? config.loop_skip_ms : config.mid_stream_skip_ms;
    if (budget_left) {
      int64_t target = position + skip;
      if (at_error.HasDuration()) {
        target = std::min(target, TailTarget(at_error.duration_ms, config.tail_skip_fraction));
      }
      c.verdict = Verdict::kRetryable;
      c.kind = ErrorKind::kMidStreamFormat;
      c.retry_target_ms = target;
      c.reason = "mid-stream parse error, skipping " + std::to_string(skip) + "ms";
    } else {
      c.verdict = Verdict::kFatal;
      c.kind = ErrorKind::kMaxRetriesExceeded;
      c.reason = "mid-stream parse error with retries exhausted";
    }
    return c;
  }

  if (near_end) {
    c.verdict = Verdict::kTreatAsCompletion;
    c.kind = ErrorKind::kGenericNearEnd;
    c.reason = std::string(engine::EngineErrorCodeName(error.code)) + " " +
               std::to_string(*remaining) + "ms before end";
    return c;
  }

  if (IsNetworkError(error)) {
    if (budget_left) {
      c.verdict = Verdict::kRetryable;
      c.kind = ErrorKind::kNetwork;
      c.retry_target_ms = position;
      c.reason = std::string("network error (") + engine::EngineErrorCodeName(error.code) + ")";
    } else {
      c.verdict = Verdict::kFatal;
      c.kind = ErrorKind::kMaxRetriesExceeded;
      c.reason = "network error with retries exhausted";
    }
    return c;
  }

  c.verdict = Verdict::kFatal;
  c.kind = ErrorKind::kFatal;
  c.reason = std::string("unrecoverable ") + engine::EngineErrorCodeName(error.code);
  return c;
}

}  // namespace reprise::recovery
