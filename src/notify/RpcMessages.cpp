// Repository: Reprise
// Component: JSON-RPC Messages
// Purpose: Envelope builders for playerEvent and nextEpisode notifications.
// Copyright (c) 2026 Reprise

#include "reprise/notify/RpcMessages.hpp"

#include <cstdio>
#include <sstream>

#include "reprise/util/JsonText.hpp"

namespace reprise::notify {

std::string FormatSeconds(int64_t ms) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.3f", static_cast<double>(ms) / 1000.0);
  return buf;
}

std::string BuildPlayerEvent(const std::string& event, int64_t position_ms,
                             int64_t duration_ms, bool paused) {
  std::ostringstream o;
  o << "{\"jsonrpc\":\"2.0\",\"method\":\"playerEvent\",\"params\":{"
    << "\"event\":\"" << util::JsonEscape(event) << "\""
    << ",\"position\":" << FormatSeconds(position_ms)
    << ",\"duration\":" << FormatSeconds(duration_ms)
    << ",\"paused\":" << (paused ? "true" : "false")
    << "}}";
  return o.str();
}

std::string BuildNextEpisode(int season, int episode, const std::string& show_id,
                             const std::string& content_ref) {
  std::ostringstream o;
  o << "{\"jsonrpc\":\"2.0\",\"method\":\"nextEpisode\",\"params\":{"
    << "\"season\":" << season
    << ",\"episode\":" << episode;
  if (!show_id.empty()) {
    o << ",\"show_id\":\"" << util::JsonEscape(show_id) << "\"";
  }
  o << ",\"content_ref\":\"" << util::JsonEscape(content_ref) << "\""
    << "}}";
  return o.str();
}

}  // namespace reprise::notify
