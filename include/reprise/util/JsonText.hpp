// Repository: Reprise
// Component: Flat JSON text helpers
// Purpose: Escape and extract values from single-line flat JSON objects.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_UTIL_JSON_TEXT_HPP_
#define REPRISE_UTIL_JSON_TEXT_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace reprise::util {

// Minimal helpers for the flat objects this project writes and reads:
// RPC envelopes, resume records, replay scripts and stream listings.
// Not a general JSON parser: nested objects are only located, not decoded.

std::string JsonEscape(const std::string& s);

// Each extractor searches for "key": starting at offset *pos (0 if pos is
// null) and, on success, stores the value and advances *pos past it.
bool ExtractString(const std::string& json, const std::string& key,
                   std::string* out, size_t* pos = nullptr);
bool ExtractInt64(const std::string& json, const std::string& key,
                  int64_t* out, size_t* pos = nullptr);
bool ExtractUint32(const std::string& json, const std::string& key,
                   uint32_t* out, size_t* pos = nullptr);
bool ExtractBool(const std::string& json, const std::string& key, bool* out);

// Splits the top-level objects of a JSON array value ("key":[{..},{..}])
// into their raw text. Returns false if the key or the array is missing.
bool ExtractObjectArray(const std::string& json, const std::string& key,
                        std::vector<std::string>* out);

}  // namespace reprise::util

#endif  // REPRISE_UTIL_JSON_TEXT_HPP_
