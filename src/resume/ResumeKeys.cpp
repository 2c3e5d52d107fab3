// Repository: Reprise
// Component: Resume Store
// Purpose: Candidate key derivation and best-match lookup.
// Copyright (c) 2026 Reprise

#include "reprise/resume/ResumeStore.hpp"

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

#include "reprise/util/Logger.hpp"
#include "reprise/util/UrlText.hpp"

namespace reprise::resume {

std::string Sha256Hex(const std::string& data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Sha256Hex: EVP_MD_CTX_new failed");
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("Sha256Hex: digest failed");
  }
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex << std::setw(2) << static_cast<unsigned>(digest[i]);
  }
  return hex.str();
}

std::vector<std::string> ResumeKeyCandidates(const std::string& raw_key) {
  std::vector<std::string> keys;
  auto add = [&keys](const std::string& k) {
    if (k.empty()) return;
    for (const auto& existing : keys) {
      if (existing == k) return;
    }
    keys.push_back(k);
  };

  add(raw_key);
  add(util::StripQuery(raw_key));
  const std::string decoded = util::PercentDecode(raw_key);
  add(decoded);
  add(util::LastPathSegment(decoded));
  add(Sha256Hex(raw_key));
  return keys;
}

int64_t IResumeStore::GetBest(const std::string& raw_key) const {
  for (const auto& key : ResumeKeyCandidates(raw_key)) {
    const auto stored = Get(key);
    if (stored && *stored > 0) {
      util::Logger::Debug("[ResumeStore] best match key=" + key +
                          " position_ms=" + std::to_string(*stored));
      return *stored;
    }
  }
  return 0;
}

}  // namespace reprise::resume
