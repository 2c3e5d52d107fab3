// Repository: Reprise
// Component: Session Outcome
// Purpose: Result-channel payload and the set-once terminal output of a session.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_SESSION_SESSION_OUTCOME_HPP_
#define REPRISE_SESSION_SESSION_OUTCOME_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "reprise/session/Session.hpp"

namespace reprise::session {

// Structured result returned to the launching caller.
// position_ms == duration_ms is the canonical "fully watched" signal.
struct SessionResult {
  int64_t position_ms = 0;
  int64_t duration_ms = 0;
  std::optional<int> season;
  std::optional<int> episode;

  [[nodiscard]] bool FullyWatched() const {
    return duration_ms > 0 && position_ms == duration_ms;
  }
};

// A playable reference for the caller to open as the next session.
struct NextSessionRequest {
  std::string content_ref;
  ContentKind kind = Movie{};
};

enum class OutcomeKind {
  kAdvance,      // Next item requested (callback or result channel).
  kStop,         // Content finished; nothing further requested.
  kExit,         // Session ended without a next-item signal.
  kNextSession,  // Caller should open `next`.
};

const char* OutcomeKindName(OutcomeKind kind);

struct TerminalOutcome {
  OutcomeKind kind = OutcomeKind::kExit;
  std::string reason;
  std::optional<SessionResult> result;
  std::optional<NextSessionRequest> next;
};

// Holds the session's terminal output. The first TrySet wins; later calls
// are refused so a lower-priority tier can never overwrite a decision.
class TerminalOutput {
 public:
  bool TrySet(TerminalOutcome outcome) {
    if (outcome_) return false;
    outcome_ = std::move(outcome);
    return true;
  }
  [[nodiscard]] bool IsSet() const { return outcome_.has_value(); }
  [[nodiscard]] const std::optional<TerminalOutcome>& Get() const { return outcome_; }
  void Reset() { outcome_.reset(); }

 private:
  std::optional<TerminalOutcome> outcome_;
};

}  // namespace reprise::session

#endif  // REPRISE_SESSION_SESSION_OUTCOME_HPP_
