// Repository: Reprise
// Component: JSON-RPC Messages
// Purpose: Envelope builders for playerEvent and nextEpisode notifications.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_NOTIFY_RPC_MESSAGES_HPP_
#define REPRISE_NOTIFY_RPC_MESSAGES_HPP_

#include <cstdint>
#include <string>

namespace reprise::notify {

inline constexpr const char* kEventTime = "time";
inline constexpr const char* kEventStopped = "stopped";

// Milliseconds as seconds with millisecond precision, e.g. 3599800 -> "3599.800".
std::string FormatSeconds(int64_t ms);

// {"jsonrpc":"2.0","method":"playerEvent","params":{"event":..,"position":..,"duration":..,"paused":..}}
std::string BuildPlayerEvent(const std::string& event, int64_t position_ms,
                             int64_t duration_ms, bool paused);

// {"jsonrpc":"2.0","method":"nextEpisode","params":{"season":..,"episode":..,"show_id":..,"content_ref":..}}
// show_id is omitted when empty.
std::string BuildNextEpisode(int season, int episode, const std::string& show_id,
                             const std::string& content_ref);

}  // namespace reprise::notify

#endif  // REPRISE_NOTIFY_RPC_MESSAGES_HPP_
