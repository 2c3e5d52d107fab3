// Repository: Reprise
// Component: URL text helpers
// Purpose: Query stripping, percent-decoding and segment extraction for content refs.
// Copyright (c) 2026 Reprise

#include "reprise/util/UrlText.hpp"

namespace reprise::util {

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string StripQuery(const std::string& url) {
  const size_t cut = url.find_first_of("?#");
  return cut == std::string::npos ? url : url.substr(0, cut);
}

std::string PercentDecode(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '+') {
      out += ' ';
    } else if (c == '%' && i + 2 < s.size()) {
      const int hi = HexDigit(s[i + 1]);
      const int lo = HexDigit(s[i + 2]);
      if (hi < 0 || lo < 0) {
        out += c;
        continue;
      }
      out += static_cast<char>((hi << 4) | lo);
      i += 2;
    } else {
      out += c;
    }
  }
  return out;
}

std::string LastPathSegment(const std::string& s) {
  const size_t slash = s.find_last_of('/');
  return slash == std::string::npos ? s : s.substr(slash + 1);
}

std::optional<std::string> QueryParam(const std::string& url, const std::string& name) {
  const size_t q = url.find('?');
  if (q == std::string::npos) return std::nullopt;
  size_t end_all = url.find('#', q);
  if (end_all == std::string::npos) end_all = url.size();
  size_t start = q + 1;
  while (start < end_all) {
    size_t amp = url.find('&', start);
    if (amp == std::string::npos || amp > end_all) amp = end_all;
    const std::string pair = url.substr(start, amp - start);
    const size_t eq = pair.find('=');
    const std::string key = PercentDecode(pair.substr(0, eq));
    if (key == name) {
      return eq == std::string::npos ? std::string() : PercentDecode(pair.substr(eq + 1));
    }
    start = amp + 1;
  }
  return std::nullopt;
}

}  // namespace reprise::util
