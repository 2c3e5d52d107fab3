// Repository: Reprise
// Component: Session Outcome
// Purpose: Names for terminal outcome kinds.
// Copyright (c) 2026 Reprise

#include "reprise/session/SessionOutcome.hpp"

namespace reprise::session {

const char* OutcomeKindName(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::kAdvance: return "advance";
    case OutcomeKind::kStop: return "stop";
    case OutcomeKind::kExit: return "exit";
    case OutcomeKind::kNextSession: return "next_session";
  }
  return "unknown";
}

}  // namespace reprise::session
