// Repository: Reprise
// Component: URL text helpers
// Purpose: Query stripping, percent-decoding and segment extraction for content refs.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_UTIL_URL_TEXT_HPP_
#define REPRISE_UTIL_URL_TEXT_HPP_

#include <optional>
#include <string>

namespace reprise::util {

// Everything before the first '?' (and before any '#').
std::string StripQuery(const std::string& url);

// Decodes %XX escapes and form-style '+' as space. Malformed escapes are
// kept literally.
std::string PercentDecode(const std::string& s);

// Text after the last '/', or the whole input when there is none.
std::string LastPathSegment(const std::string& s);

// Value of the first query parameter named `name`, percent-decoded.
std::optional<std::string> QueryParam(const std::string& url, const std::string& name);

}  // namespace reprise::util

#endif  // REPRISE_UTIL_URL_TEXT_HPP_
