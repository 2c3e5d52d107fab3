// Repository: Reprise
// Component: Content Identity
// Purpose: One-shot Movie/Episode classification of a content reference.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_SESSION_CONTENT_IDENTITY_HPP_
#define REPRISE_SESSION_CONTENT_IDENTITY_HPP_

#include <optional>
#include <string>
#include <utility>

#include "reprise/session/Session.hpp"

namespace reprise::session {

// Identity fields supplied explicitly by the launching caller.
struct ContentHints {
  std::optional<int> season;
  std::optional<int> episode;
  std::string show_id;
};

// Resolves the content kind with precedence:
//   1. explicit hints
//   2. query parameters of content_ref (season, episode; imdb, imdbId, show_id)
//   3. filename pattern on the decoded last path segment (S01E05 or 1x05)
// The season/episode pair comes from the first source that supplies both;
// show_id from the first source that supplies one. Without a pair the
// content is a Movie.
ContentKind ResolveContentIdentity(const ContentHints& hints,
                                   const std::string& content_ref);

// Parses "S01E05" / "s1e5" or "1x05" anywhere in `text`.
std::optional<std::pair<int, int>> ParseSeasonEpisode(const std::string& text);

// Human-searchable show title guessed from the content reference filename,
// e.g. ".../The.Expanse.S02E03.1080p.mkv?x=1" -> "The Expanse".
// Empty when nothing usable remains.
std::string DeriveTitleHint(const std::string& content_ref);

}  // namespace reprise::session

#endif  // REPRISE_SESSION_CONTENT_IDENTITY_HPP_
