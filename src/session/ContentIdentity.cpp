// Repository: Reprise
// Component: Content Identity
// Purpose: One-shot Movie/Episode classification of a content reference.
// Copyright (c) 2026 Reprise

#include "reprise/session/ContentIdentity.hpp"

#include <cctype>
#include <regex>
#include <stdexcept>

#include "reprise/util/UrlText.hpp"

namespace reprise::session {

namespace {

const std::regex& SeasonEpisodeSxE() {
  static const std::regex re("[Ss](\\d{1,2})[Ee](\\d{1,2})(?!\\d)");
  return re;
}

const std::regex& SeasonEpisodeNxM() {
  static const std::regex re("(?:^|[^0-9])(\\d{1,2})[xX](\\d{1,2})(?![0-9])");
  return re;
}

std::optional<int> ParseSmallInt(const std::optional<std::string>& raw) {
  if (!raw || raw->empty() || raw->size() > 4) return std::nullopt;
  for (char c : *raw) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }
  return std::stoi(*raw);
}

std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (std::isspace(static_cast<unsigned char>(s[b])) || s[b] == '-')) ++b;
  while (e > b && (std::isspace(static_cast<unsigned char>(s[e - 1])) || s[e - 1] == '-')) --e;
  return s.substr(b, e - b);
}

std::string DecodedFilename(const std::string& content_ref) {
  return util::PercentDecode(util::LastPathSegment(util::StripQuery(content_ref)));
}

}  // namespace

std::string DescribeKind(const ContentKind& kind) {
  if (const auto* ep = std::get_if<Episode>(&kind)) {
    std::string out = "Episode S" + std::to_string(ep->season) + "E" + std::to_string(ep->episode);
    if (!ep->show_id.empty()) out += " (" + ep->show_id + ")";
    return out;
  }
  return "Movie";
}

std::optional<std::pair<int, int>> ParseSeasonEpisode(const std::string& text) {
  std::smatch m;
  if (std::regex_search(text, m, SeasonEpisodeSxE()) ||
      std::regex_search(text, m, SeasonEpisodeNxM())) {
    return std::make_pair(std::stoi(m[1].str()), std::stoi(m[2].str()));
  }
  return std::nullopt;
}

ContentKind ResolveContentIdentity(const ContentHints& hints,
                                   const std::string& content_ref) {
  std::optional<std::pair<int, int>> pair;
  if (hints.season && hints.episode) {
    pair = std::make_pair(*hints.season, *hints.episode);
  }

  if (!pair) {
    const auto season = ParseSmallInt(util::QueryParam(content_ref, "season"));
    const auto episode = ParseSmallInt(util::QueryParam(content_ref, "episode"));
    if (season && episode) pair = std::make_pair(*season, *episode);
  }

  if (!pair) {
    pair = ParseSeasonEpisode(DecodedFilename(content_ref));
  }

  if (!pair) return Movie{};

  Episode ep;
  ep.season = pair->first;
  ep.episode = pair->second;
  ep.show_id = hints.show_id;
  if (ep.show_id.empty()) {
    for (const char* key : {"imdb", "imdbId", "show_id"}) {
      auto v = util::QueryParam(content_ref, key);
      if (v && !v->empty()) {
        ep.show_id = *v;
        break;
      }
    }
  }
  return ep;
}

std::string DeriveTitleHint(const std::string& content_ref) {
  std::string name = DecodedFilename(content_ref);

  // Drop a short trailing extension (.mkv, .mp4, .webm).
  const size_t dot = name.find_last_of('.');
  if (dot != std::string::npos && name.size() - dot - 1 >= 2 && name.size() - dot - 1 <= 4) {
    bool alnum = true;
    for (size_t i = dot + 1; i < name.size(); ++i) {
      if (!std::isalnum(static_cast<unsigned char>(name[i]))) alnum = false;
    }
    if (alnum) name.erase(dot);
  }

  std::smatch m;
  if (std::regex_search(name, m, SeasonEpisodeSxE()) ||
      std::regex_search(name, m, SeasonEpisodeNxM())) {
    if (m.position(0) > 0) name.erase(static_cast<size_t>(m.position(0)));
  }

  static const std::regex kResolution("\\d{3,4}[pP]");
  static const std::regex kBracketed("\\[[^\\]]*\\]|\\([^)]*\\)");
  name = std::regex_replace(name, kBracketed, " ");
  name = std::regex_replace(name, kResolution, " ");

  std::string spaced;
  spaced.reserve(name.size());
  for (char c : name) {
    const char mapped = (c == '.' || c == '_') ? ' ' : c;
    if (mapped == ' ' && (spaced.empty() || spaced.back() == ' ')) continue;
    spaced += mapped;
  }
  return Trim(spaced);
}

}  // namespace reprise::session
