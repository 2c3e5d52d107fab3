// Repository: Reprise
// Component: Flat JSON text helpers
// Purpose: Escape and extract values from single-line flat JSON objects.
// Copyright (c) 2026 Reprise

#include "reprise/util/JsonText.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace reprise::util {

namespace {

// Locates the first character of the value for "key": at or after *pos.
// Returns npos when the key is absent.
size_t FindValueStart(const std::string& json, const std::string& key,
                      size_t from) {
  const std::string search = "\"" + key + "\"";
  size_t at = json.find(search, from);
  while (at != std::string::npos) {
    size_t i = at + search.size();
    while (i < json.size() && (json[i] == ' ' || json[i] == '\t')) ++i;
    if (i < json.size() && json[i] == ':') {
      ++i;
      while (i < json.size() && (json[i] == ' ' || json[i] == '\t')) ++i;
      return i;
    }
    at = json.find(search, at + 1);
  }
  return std::string::npos;
}

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    *out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    *out += static_cast<char>(0xC0 | (cp >> 6));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    *out += static_cast<char>(0xE0 | (cp >> 12));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
      out += buf;
    } else {
      out += c;
    }
  }
  return out;
}

bool ExtractString(const std::string& json, const std::string& key,
                   std::string* out, size_t* pos) {
  size_t start = FindValueStart(json, key, pos ? *pos : 0);
  if (start == std::string::npos || start >= json.size() || json[start] != '"') {
    return false;
  }
  ++start;
  out->clear();
  for (size_t i = start; i < json.size(); ++i) {
    if (json[i] == '\\' && i + 1 < json.size()) {
      const char esc = json[i + 1];
      if (esc == '"') { *out += '"'; i++; continue; }
      if (esc == '\\') { *out += '\\'; i++; continue; }
      if (esc == '/') { *out += '/'; i++; continue; }
      if (esc == 'n') { *out += '\n'; i++; continue; }
      if (esc == 'r') { *out += '\r'; i++; continue; }
      if (esc == 't') { *out += '\t'; i++; continue; }
      if (esc == 'u' && i + 5 < json.size()) {
        uint32_t cp = 0;
        bool valid = true;
        for (size_t k = i + 2; k < i + 6; ++k) {
          const int v = HexValue(json[k]);
          if (v < 0) { valid = false; break; }
          cp = (cp << 4) | static_cast<uint32_t>(v);
        }
        if (valid) {
          AppendUtf8(cp, out);
          i += 5;
          continue;
        }
      }
    }
    if (json[i] == '"') {
      if (pos) *pos = i + 1;
      return true;
    }
    *out += json[i];
  }
  return false;
}

bool ExtractInt64(const std::string& json, const std::string& key,
                  int64_t* out, size_t* pos) {
  size_t start = FindValueStart(json, key, pos ? *pos : 0);
  if (start == std::string::npos) return false;
  bool neg = false;
  if (start < json.size() && json[start] == '-') { neg = true; ++start; }
  if (start >= json.size() || !std::isdigit(static_cast<unsigned char>(json[start]))) {
    return false;
  }
  size_t end = start;
  while (end < json.size() && std::isdigit(static_cast<unsigned char>(json[end]))) ++end;
  try {
    const int64_t v = std::stoll(json.substr(start, end - start));
    *out = neg ? -v : v;
  } catch (const std::out_of_range&) {
    return false;
  }
  if (pos) *pos = end;
  return true;
}

bool ExtractUint32(const std::string& json, const std::string& key,
                   uint32_t* out, size_t* pos) {
  int64_t v = 0;
  size_t local = pos ? *pos : 0;
  if (!ExtractInt64(json, key, &v, &local)) return false;
  if (v < 0 || v > 0xFFFFFFFFll) return false;
  *out = static_cast<uint32_t>(v);
  if (pos) *pos = local;
  return true;
}

bool ExtractBool(const std::string& json, const std::string& key, bool* out) {
  const size_t start = FindValueStart(json, key, 0);
  if (start == std::string::npos) return false;
  if (json.compare(start, 4, "true") == 0) { *out = true; return true; }
  if (json.compare(start, 5, "false") == 0) { *out = false; return true; }
  return false;
}

bool ExtractObjectArray(const std::string& json, const std::string& key,
                        std::vector<std::string>* out) {
  size_t i = FindValueStart(json, key, 0);
  if (i == std::string::npos || i >= json.size() || json[i] != '[') return false;
  ++i;
  out->clear();
  while (i < json.size()) {
    while (i < json.size() && json[i] != '{' && json[i] != ']') ++i;
    if (i >= json.size()) return false;
    if (json[i] == ']') return true;
    const size_t begin = i;
    size_t depth = 0;
    for (; i < json.size(); ++i) {
      const char c = json[i];
      if (c == '"') {
        ++i;
        while (i < json.size() && json[i] != '"') {
          if (json[i] == '\\') ++i;
          ++i;
        }
        continue;
      }
      if (c == '{') {
        ++depth;
      } else if (c == '}') {
        if (--depth == 0) {
          out->push_back(json.substr(begin, i - begin + 1));
          ++i;
          break;
        }
      }
    }
    if (depth != 0) return false;
  }
  return false;
}

}  // namespace reprise::util
