// Repository: Reprise
// Component: File Resume Store
// Purpose: Durable resume positions written off the caller's thread.
// Copyright (c) 2026 Reprise

#include "reprise/resume/ResumeStore.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>

#include "reprise/util/JsonText.hpp"
#include "reprise/util/Logger.hpp"

namespace reprise::resume {

namespace {

uint32_t RecordCrc(const std::string& key, int64_t position_ms) {
  const std::string covered = key + ":" + std::to_string(position_ms);
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(covered.data()),
              static_cast<uInt>(covered.size()));
  return static_cast<uint32_t>(crc);
}

std::string RecordLine(const std::string& key, int64_t position_ms) {
  std::ostringstream o;
  o << "{\"key\":\"" << util::JsonEscape(key) << "\""
    << ",\"position_ms\":" << position_ms
    << ",\"crc32\":" << RecordCrc(key, position_ms) << "}";
  return o.str();
}

bool ParseRecordLine(const std::string& line, std::string* key, int64_t* position_ms) {
  if (line.empty() || line.front() != '{' || line.back() != '}') return false;
  size_t pos = 0;
  uint32_t crc = 0;
  if (!util::ExtractString(line, "key", key, &pos)) return false;
  if (!util::ExtractInt64(line, "position_ms", position_ms, &pos)) return false;
  if (!util::ExtractUint32(line, "crc32", &crc, &pos)) return false;
  if (*position_ms < 0) return false;
  return crc == RecordCrc(*key, *position_ms);
}

// mkdir -p for the directory part of `path`.
void EnsureParentDirectory(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) return;
  const std::string dir = path.substr(0, slash);
  for (size_t i = 1; i <= dir.size(); ++i) {
    if (i != dir.size() && dir[i] != '/') continue;
    const std::string partial = dir.substr(0, i);
    if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      throw std::runtime_error("FileResumeStore: cannot create directory " + partial);
    }
  }
}

}  // namespace

FileResumeStore::FileResumeStore(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("FileResumeStore: empty path");
  }
  EnsureParentDirectory(path_);
  Load();
  writer_thread_ = std::thread(&FileResumeStore::WriterLoop, this);
}

FileResumeStore::~FileResumeStore() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (writer_thread_.joinable()) writer_thread_.join();
}

void FileResumeStore::Load() {
  std::ifstream in(path_);
  if (!in) return;  // First run: nothing persisted yet.
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::string key;
    int64_t position_ms = 0;
    if (!ParseRecordLine(line, &key, &position_ms)) {
      ++skipped_records_;
      continue;
    }
    entries_[key] = position_ms;
  }
  if (skipped_records_ > 0) {
    util::Logger::Warn("[ResumeStore] skipped " + std::to_string(skipped_records_) +
                       " corrupt record(s) in " + path_);
  }
}

std::optional<int64_t> FileResumeStore::Get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

void FileResumeStore::Put(const std::string& key, int64_t position_ms) {
  if (position_ms < 0) {
    throw std::invalid_argument("FileResumeStore: negative position for " + key);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = position_ms;
    ++dirty_generation_;
  }
  cv_.notify_one();
}

size_t FileResumeStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

bool FileResumeStore::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  const uint64_t target = dirty_generation_;
  cv_.notify_one();
  flushed_cv_.wait(lock, [this, target] {
    return written_generation_ >= target || shutdown_;
  });
  return last_write_ok_ && written_generation_ >= target;
}

void FileResumeStore::WriterLoop() {
  while (true) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] {
      return shutdown_ || dirty_generation_ != written_generation_;
    });
    if (dirty_generation_ == written_generation_ && shutdown_) break;

    // Coalesce bursts of Put() into one rewrite.
    if (!shutdown_) {
      cv_.wait_for(lock, std::chrono::milliseconds(kWriteCoalesceMs),
                   [this] { return shutdown_; });
    }
    const uint64_t generation = dirty_generation_;
    const std::map<std::string, int64_t> snapshot = entries_;
    lock.unlock();

    const bool ok = WriteSnapshot(snapshot);

    lock.lock();
    last_write_ok_ = ok;
    // A failed write still advances the generation so Flush() returns; the
    // next Put() retries with the full map.
    written_generation_ = generation;
    lock.unlock();
    flushed_cv_.notify_all();
  }
  flushed_cv_.notify_all();
}

bool FileResumeStore::WriteSnapshot(const std::map<std::string, int64_t>& snapshot) {
  const std::string tmp_path =
      path_ + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc);
    if (!of) {
      util::Logger::Error("[ResumeStore] cannot open " + tmp_path);
      return false;
    }
    for (const auto& [key, position_ms] : snapshot) {
      of << RecordLine(key, position_ms) << '\n';
    }
    of.flush();
    if (!of) {
      util::Logger::Error("[ResumeStore] write failed " + tmp_path);
      (void)unlink(tmp_path.c_str());
      return false;
    }
  }
  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    util::Logger::Error("[ResumeStore] rename failed " + tmp_path + " -> " + path_ +
                        " errno=" + std::to_string(errno));
    (void)unlink(tmp_path.c_str());
    return false;
  }
  return true;
}

}  // namespace reprise::resume
