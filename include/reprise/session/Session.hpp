// Repository: Reprise
// Component: Session Model
// Purpose: Session, content kind, and playback snapshot value types.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_SESSION_SESSION_HPP_
#define REPRISE_SESSION_SESSION_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace reprise::session {

struct Movie {};

struct Episode {
  std::string show_id;  // Canonical catalog id when known, else empty.
  int season = 0;
  int episode = 0;
};

// Classified once per session by ResolveContentIdentity and never re-derived.
using ContentKind = std::variant<Movie, Episode>;

[[nodiscard]] inline bool IsEpisode(const ContentKind& kind) {
  return std::holds_alternative<Episode>(kind);
}

std::string DescribeKind(const ContentKind& kind);

struct Session {
  std::string content_ref;
  ContentKind kind = Movie{};
  int64_t started_at_ms = 0;
  int64_t last_known_duration_ms = 0;
};

// Point-in-time engine read. duration_ms <= 0 means unknown.
struct PlaybackSnapshot {
  int64_t position_ms = 0;
  int64_t duration_ms = 0;
  bool is_playing = false;

  [[nodiscard]] bool HasDuration() const { return duration_ms > 0; }
  // Milliseconds left, or nullopt while duration is unknown.
  [[nodiscard]] std::optional<int64_t> RemainingMs() const {
    if (duration_ms <= 0) return std::nullopt;
    return duration_ms - position_ms;
  }
  [[nodiscard]] double PercentWatched() const {
    if (duration_ms <= 0) return 0.0;
    return 100.0 * static_cast<double>(position_ms) / static_cast<double>(duration_ms);
  }
};

}  // namespace reprise::session

#endif  // REPRISE_SESSION_SESSION_HPP_
