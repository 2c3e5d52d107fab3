// Repository: Reprise
// Component: Resume Store
// Purpose: Persistent key -> position map with multi-key fuzzy lookup.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_RESUME_RESUME_STORE_HPP_
#define REPRISE_RESUME_RESUME_STORE_HPP_

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace reprise::resume {

// position_ms == 0 is the "cleared / start over" sentinel; an absent key is
// "unknown". Implementations must not block the caller on disk I/O.
class IResumeStore {
 public:
  virtual ~IResumeStore() = default;

  [[nodiscard]] virtual std::optional<int64_t> Get(const std::string& key) const = 0;
  // Throws std::invalid_argument for a negative position.
  virtual void Put(const std::string& key, int64_t position_ms) = 0;

  // First stored value > 0 among ResumeKeyCandidates(raw_key), else 0.
  [[nodiscard]] int64_t GetBest(const std::string& raw_key) const;
};

// Lookup order: raw key, query stripped, percent-decoded, last path segment
// of the decoded key, SHA-256 hex of the raw key. Duplicates are dropped.
std::vector<std::string> ResumeKeyCandidates(const std::string& raw_key);

// Lower-case hex SHA-256 digest. Throws std::runtime_error if the digest
// cannot be computed.
std::string Sha256Hex(const std::string& data);

// FileResumeStore keeps the map in memory and persists it from a writer
// thread. Each write replaces the file atomically (temp + rename).
//
// File layout, one record per line:
//   {"key":"<escaped>","position_ms":N,"crc32":C}
// crc32 covers "<key>:<N>". Corrupt or mismatching lines are skipped on
// load; later lines for the same key win.
class FileResumeStore : public IResumeStore {
 public:
  static constexpr int kWriteCoalesceMs = 200;

  // Throws std::runtime_error if the parent directory cannot be created.
  explicit FileResumeStore(std::string path);
  ~FileResumeStore() override;

  FileResumeStore(const FileResumeStore&) = delete;
  FileResumeStore& operator=(const FileResumeStore&) = delete;

  [[nodiscard]] std::optional<int64_t> Get(const std::string& key) const override;
  void Put(const std::string& key, int64_t position_ms) override;

  // Blocks until every Put issued before the call is on disk. Returns false
  // if the last write attempt failed.
  bool Flush();

  [[nodiscard]] size_t Size() const;
  // Lines rejected during the initial load.
  [[nodiscard]] size_t SkippedRecords() const { return skipped_records_; }

 private:
  void Load();
  void WriterLoop();
  bool WriteSnapshot(const std::map<std::string, int64_t>& snapshot);

  std::string path_;
  size_t skipped_records_ = 0;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable flushed_cv_;
  std::map<std::string, int64_t> entries_;
  uint64_t dirty_generation_ = 0;
  uint64_t written_generation_ = 0;
  bool last_write_ok_ = true;
  bool shutdown_ = false;
  std::thread writer_thread_;
};

}  // namespace reprise::resume

#endif  // REPRISE_RESUME_RESUME_STORE_HPP_
