// Repository: Reprise
// Component: External Lookup
// Purpose: Catalog and stream-resolution seams used by the last-resort advance tier.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_ADVANCE_EXTERNAL_LOOKUP_HPP_
#define REPRISE_ADVANCE_EXTERNAL_LOOKUP_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "reprise/notify/HttpTransport.hpp"

namespace reprise::advance {

struct StreamCandidate {
  std::string name;   // Provider label, e.g. "[RD+] Torrentio"
  std::string title;  // Release description: quality, size, source
  std::string url;    // Playable reference; empty for magnet-only entries
};

// Both resolvers perform blocking I/O and are only called from a
// background executor.
class ICatalogResolver {
 public:
  virtual ~ICatalogResolver() = default;
  // Canonical show id (e.g. an IMDb id) for a free-text title.
  virtual std::optional<std::string> ResolveShowId(const std::string& title_hint) = 0;
};

class IStreamResolver {
 public:
  virtual ~IStreamResolver() = default;
  virtual std::vector<StreamCandidate> ResolveEpisodeStreams(const std::string& show_id,
                                                             int season, int episode) = 0;
};

// Ranking: source (torbox 3, real-debrid 2, alldebrid 1, torrent 0,
// unknown -1), then quality (1080p 3, 720p 2, 480p 1, other 0), then smaller
// size.
int SourceRank(const StreamCandidate& candidate);
int QualityRank(const StreamCandidate& candidate);
// Size in bytes parsed from "<n> GB|MB" in the title; INT64_MAX if absent.
int64_t SizeBytes(const StreamCandidate& candidate);

// Best candidate with a non-empty url, or nullopt.
std::optional<StreamCandidate> SelectBestStream(const std::vector<StreamCandidate>& candidates);

// Parses {"streams":[{"name":..,"title":..,"url":..}, ...]}.
std::vector<StreamCandidate> ParseStreamListing(const std::string& json);

// Stream-addon style resolver over plain HTTP:
//   GET <base_url>/stream/series/<show_id>:<season>:<episode>.json
class HttpStreamResolver : public IStreamResolver {
 public:
  HttpStreamResolver(std::string base_url,
                     std::shared_ptr<notify::IHttpTransport> transport,
                     int timeout_ms);

  std::vector<StreamCandidate> ResolveEpisodeStreams(const std::string& show_id,
                                                     int season, int episode) override;

 private:
  std::string base_url_;
  std::shared_ptr<notify::IHttpTransport> transport_;
  int timeout_ms_;
};

}  // namespace reprise::advance

#endif  // REPRISE_ADVANCE_EXTERNAL_LOOKUP_HPP_
