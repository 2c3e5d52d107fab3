// Repository: Reprise
// Component: External Lookup
// Purpose: Stream ranking and the HTTP stream-addon resolver.
// Copyright (c) 2026 Reprise

#include "reprise/advance/ExternalLookup.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <regex>
#include <stdexcept>

#include "reprise/util/JsonText.hpp"
#include "reprise/util/Logger.hpp"

namespace reprise::advance {

namespace {

std::string LowerLabel(const StreamCandidate& c) {
  std::string text = c.name + " " + c.title;
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return text;
}

}  // namespace

int SourceRank(const StreamCandidate& candidate) {
  const std::string text = LowerLabel(candidate);
  if (text.find("torbox") != std::string::npos || text.find("[tb") != std::string::npos) return 3;
  if (text.find("real-debrid") != std::string::npos ||
      text.find("realdebrid") != std::string::npos ||
      text.find("[rd") != std::string::npos) {
    return 2;
  }
  if (text.find("alldebrid") != std::string::npos || text.find("[ad") != std::string::npos) {
    return 1;
  }
  if (text.find("torrent") != std::string::npos) return 0;
  return -1;
}

int QualityRank(const StreamCandidate& candidate) {
  static const std::regex kQuality("(\\d{3,4})p");
  std::smatch m;
  const std::string text = LowerLabel(candidate);
  if (!std::regex_search(text, m, kQuality)) return 0;
  const std::string q = m[1].str();
  if (q == "1080") return 3;
  if (q == "720") return 2;
  if (q == "480") return 1;
  return 0;
}

int64_t SizeBytes(const StreamCandidate& candidate) {
  static const std::regex kSize("([0-9]+(?:\\.[0-9]+)?)\\s*(GB|MB)", std::regex::icase);
  std::smatch m;
  if (!std::regex_search(candidate.title, m, kSize)) {
    return std::numeric_limits<int64_t>::max();
  }
  double value = 0.0;
  try {
    value = std::stod(m[1].str());
  } catch (const std::exception&) {
    return std::numeric_limits<int64_t>::max();
  }
  const char unit = static_cast<char>(std::toupper(static_cast<unsigned char>(m[2].str()[0])));
  const double scale = unit == 'G' ? 1e9 : 1e6;
  return static_cast<int64_t>(value * scale);
}

std::optional<StreamCandidate> SelectBestStream(const std::vector<StreamCandidate>& candidates) {
  const StreamCandidate* best = nullptr;
  for (const auto& c : candidates) {
    if (c.url.empty()) continue;
    if (best == nullptr) {
      best = &c;
      continue;
    }
    const int src = SourceRank(c) - SourceRank(*best);
    if (src != 0) {
      if (src > 0) best = &c;
      continue;
    }
    const int quality = QualityRank(c) - QualityRank(*best);
    if (quality != 0) {
      if (quality > 0) best = &c;
      continue;
    }
    if (SizeBytes(c) < SizeBytes(*best)) best = &c;
  }
  if (best == nullptr) return std::nullopt;
  return *best;
}

std::vector<StreamCandidate> ParseStreamListing(const std::string& json) {
  std::vector<std::string> objects;
  std::vector<StreamCandidate> out;
  if (!util::ExtractObjectArray(json, "streams", &objects)) return out;
  for (const auto& obj : objects) {
    StreamCandidate c;
    util::ExtractString(obj, "name", &c.name);
    util::ExtractString(obj, "title", &c.title);
    util::ExtractString(obj, "url", &c.url);
    out.push_back(std::move(c));
  }
  return out;
}

HttpStreamResolver::HttpStreamResolver(std::string base_url,
                                       std::shared_ptr<notify::IHttpTransport> transport,
                                       int timeout_ms)
    : base_url_(std::move(base_url)),
      transport_(std::move(transport)),
      timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::vector<StreamCandidate> HttpStreamResolver::ResolveEpisodeStreams(const std::string& show_id,
                                                                      int season, int episode) {
  const std::string url = base_url_ + "/stream/series/" + show_id + ":" +
                          std::to_string(season) + ":" + std::to_string(episode) + ".json";
  const notify::HttpResponse response = transport_->Get(url, timeout_ms_);
  if (!response.ok) {
    util::Logger::Warn("[StreamResolver] " + url + " failed status=" +
                       std::to_string(response.status) + " " + response.error);
    return {};
  }
  auto streams = ParseStreamListing(response.body);
  util::Logger::Info("[StreamResolver] " + std::to_string(streams.size()) + " stream(s) for " +
                     show_id + " S" + std::to_string(season) + "E" + std::to_string(episode));
  return streams;
}

}  // namespace reprise::advance
