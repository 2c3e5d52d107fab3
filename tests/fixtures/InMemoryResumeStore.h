// Repository: Reprise
// Component: Test Fixtures
// Purpose: Map-backed resume store with a write log.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_TESTS_FIXTURES_IN_MEMORY_RESUME_STORE_H_
#define REPRISE_TESTS_FIXTURES_IN_MEMORY_RESUME_STORE_H_

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "reprise/resume/ResumeStore.hpp"

namespace reprise::tests::fixtures {

class InMemoryResumeStore : public resume::IResumeStore {
 public:
  std::optional<int64_t> Get(const std::string& key) const override {
    auto it = values.find(key);
    if (it == values.end()) return std::nullopt;
    return it->second;
  }

  void Put(const std::string& key, int64_t position_ms) override {
    values[key] = position_ms;
    writes.emplace_back(key, position_ms);
  }

  std::map<std::string, int64_t> values;
  std::vector<std::pair<std::string, int64_t>> writes;
};

}  // namespace reprise::tests::fixtures

#endif  // REPRISE_TESTS_FIXTURES_IN_MEMORY_RESUME_STORE_H_
