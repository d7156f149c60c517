#pragma once

#include "memorybank/common/result.hpp"
#include "memorybank/config/schema.hpp"
#include "memorybank/observability/observer.hpp"
#include "memorybank/storage/file_operations.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace memorybank::storage {

struct CacheOptions {
  std::size_t max_size = 100;
  std::chrono::milliseconds max_age{60 * 60 * 1000};
  bool enable_metrics = true;

  [[nodiscard]] static CacheOptions from_config(const config::CacheConfig &config);
};

struct CacheEntry {
  std::string content;
  std::int64_t mtime_ns = 0;
  std::uintmax_t size_bytes = 0;
  std::chrono::steady_clock::time_point last_accessed;
  std::uint64_t access_count = 0;
};

struct CacheStats {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t evictions = 0;
  std::uint64_t reloads = 0;
  std::uint64_t total_files = 0;
  std::size_t current_size = 0;
  std::size_t max_size = 0;
  double hit_rate = 0.0;
  std::string last_reset;
};

struct CacheUsage {
  std::size_t entries = 0;
  std::size_t max_size = 0;
  double utilization_percent = 0.0;
  std::uintmax_t content_bytes = 0;
  std::string content_size;
};

// LRU cache of file contents. An entry is served only while its recorded mtime
// and size still match the file on disk and it has been touched within max_age.
class CacheManager {
public:
  CacheManager(std::shared_ptr<RetryingFileOperations> file_ops, CacheOptions options,
               std::shared_ptr<observability::IObserver> observer = nullptr);

  [[nodiscard]] common::Result<std::string> get(const std::filesystem::path &path);
  // Records content the caller has just written; stats the file for its mtime.
  [[nodiscard]] common::Status put(const std::filesystem::path &path, const std::string &content);

  void invalidate();
  void invalidate(const std::filesystem::path &path);

  [[nodiscard]] bool contains(const std::filesystem::path &path) const;
  [[nodiscard]] std::size_t cleanup_expired();

  [[nodiscard]] CacheStats stats() const;
  void reset_stats();
  [[nodiscard]] CacheUsage usage() const;
  [[nodiscard]] const CacheOptions &options() const { return options_; }

private:
  using LruList = std::list<std::string>;

  struct Slot {
    CacheEntry entry;
    LruList::iterator position;
  };

  [[nodiscard]] bool expired(const CacheEntry &entry,
                             std::chrono::steady_clock::time_point now) const;
  [[nodiscard]] bool consistent_locked() const;
  [[nodiscard]] std::uint64_t version_locked(const std::string &key) const;
  void bump_version_locked(const std::string &key);
  void clear_locked();
  void store_locked(const std::string &key, std::string content, const FileStat &info,
                    std::vector<std::string> &evicted);
  [[nodiscard]] common::Status inconsistency(const std::string &operation);
  void report_evictions(const std::vector<std::string> &evicted);

  std::shared_ptr<RetryingFileOperations> file_ops_;
  CacheOptions options_;
  std::shared_ptr<observability::IObserver> observer_;

  mutable std::mutex mutex_;
  LruList lru_;
  std::unordered_map<std::string, Slot> entries_;
  // Bumped by put and invalidate. A get stores what it read only if the key's
  // version is unchanged since before its stat.
  std::unordered_map<std::string, std::uint64_t> versions_;
  std::uint64_t next_version_ = 0;
  std::uint64_t cleared_version_ = 0;
  std::uint64_t hits_ = 0;
  std::uint64_t misses_ = 0;
  std::uint64_t evictions_ = 0;
  std::uint64_t reloads_ = 0;
  std::uint64_t total_files_ = 0;
  std::string last_reset_;
};

} // namespace memorybank::storage
