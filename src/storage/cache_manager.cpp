#include "memorybank/storage/cache_manager.hpp"

#include "memorybank/common/fs.hpp"
#include "memorybank/common/time.hpp"
#include "memorybank/observability/noop_observer.hpp"

#include <algorithm>
#include <vector>

namespace memorybank::storage {

namespace {

std::string cache_key(const std::filesystem::path &path) {
  return path.lexically_normal().string();
}

} // namespace

CacheOptions CacheOptions::from_config(const config::CacheConfig &config) {
  return CacheOptions{.max_size = std::max<std::size_t>(1, config.max_size),
                      .max_age = std::chrono::milliseconds(config.max_age_ms),
                      .enable_metrics = config.enable_metrics};
}

CacheManager::CacheManager(std::shared_ptr<RetryingFileOperations> file_ops, CacheOptions options,
                           std::shared_ptr<observability::IObserver> observer)
    : file_ops_(std::move(file_ops)), options_(options),
      observer_(observability::ensure_observer(std::move(observer))),
      last_reset_(common::now_rfc3339()) {
  options_.max_size = std::max<std::size_t>(1, options_.max_size);
}

bool CacheManager::expired(const CacheEntry &entry,
                           const std::chrono::steady_clock::time_point now) const {
  return now - entry.last_accessed > options_.max_age;
}

bool CacheManager::consistent_locked() const { return lru_.size() == entries_.size(); }

std::uint64_t CacheManager::version_locked(const std::string &key) const {
  const auto it = versions_.find(key);
  return it == versions_.end() ? cleared_version_ : it->second;
}

void CacheManager::bump_version_locked(const std::string &key) { versions_[key] = ++next_version_; }

void CacheManager::clear_locked() {
  lru_.clear();
  entries_.clear();
  versions_.clear();
  cleared_version_ = ++next_version_;
}

common::Status CacheManager::inconsistency(const std::string &operation) {
  const std::string message = "LRU list and entry map diverged during " + operation;
  observer_->record_event(
      observability::ErrorEvent{.component = "cache", .message = message + "; cache cleared"});
  return common::Status::error(common::ErrorCode::CacheInconsistency, message);
}

void CacheManager::report_evictions(const std::vector<std::string> &evicted) {
  for (const auto &path : evicted) {
    observer_->record_event(observability::CacheEvictionEvent{.path = path});
  }
}

void CacheManager::store_locked(const std::string &key, std::string content, const FileStat &info,
                                std::vector<std::string> &evicted) {
  const auto now = std::chrono::steady_clock::now();
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    lru_.push_front(key);
    Slot slot{.entry = CacheEntry{.content = std::move(content),
                                  .mtime_ns = info.mtime_ns,
                                  .size_bytes = info.size_bytes,
                                  .last_accessed = now,
                                  .access_count = 1},
              .position = lru_.begin()};
    entries_.emplace(key, std::move(slot));
    ++total_files_;
  } else {
    auto &entry = it->second.entry;
    entry.content = std::move(content);
    entry.mtime_ns = info.mtime_ns;
    entry.size_bytes = info.size_bytes;
    entry.last_accessed = now;
    ++entry.access_count;
    lru_.splice(lru_.begin(), lru_, it->second.position);
  }

  while (entries_.size() > options_.max_size && !lru_.empty()) {
    const std::string victim = lru_.back();
    lru_.pop_back();
    entries_.erase(victim);
    ++evictions_;
    evicted.push_back(victim);
  }
}

common::Result<std::string> CacheManager::get(const std::filesystem::path &path) {
  const std::string key = cache_key(path);

  std::uint64_t observed_version = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observed_version = version_locked(key);
  }

  const auto info = file_ops_->stat(path);
  if (!info.ok()) {
    if (info.code() == common::ErrorCode::NotFound) {
      invalidate(path);
    }
    return common::Result<std::string>::failure(info.details());
  }
  if (info.value().is_directory) {
    return common::Result<std::string>::failure(common::ErrorCode::IoError,
                                                "Not a regular file: " + key);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!consistent_locked()) {
      clear_locked();
      return common::Result<std::string>::failure(inconsistency("get").details());
    }

    const auto now = std::chrono::steady_clock::now();
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      auto &entry = it->second.entry;
      if (entry.mtime_ns == info.value().mtime_ns && entry.size_bytes == info.value().size_bytes &&
          !expired(entry, now)) {
        if (options_.enable_metrics) {
          ++hits_;
        }
        entry.last_accessed = now;
        ++entry.access_count;
        lru_.splice(lru_.begin(), lru_, it->second.position);
        return common::Result<std::string>::success(entry.content);
      }
      ++reloads_;
    } else if (options_.enable_metrics) {
      ++misses_;
    }
  }

  auto content = file_ops_->read(path);
  if (!content.ok()) {
    if (content.code() == common::ErrorCode::NotFound) {
      invalidate(path);
    }
    return content;
  }

  std::vector<std::string> evicted;
  std::size_t size_after = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!consistent_locked()) {
      clear_locked();
      return common::Result<std::string>::failure(inconsistency("get").details());
    }
    const auto existing = entries_.find(key);
    // A put or invalidate since our stat means what we read may already be stale.
    const bool unchanged = version_locked(key) == observed_version;
    if (unchanged &&
        (existing == entries_.end() || existing->second.entry.mtime_ns <= info.value().mtime_ns)) {
      store_locked(key, content.value(), info.value(), evicted);
    }
    size_after = entries_.size();
  }

  report_evictions(evicted);
  observer_->record_event(observability::FileLoadedEvent{
      .path = key, .bytes = content.value().size(), .from_cache = false});
  observer_->record_metric(
      observability::CacheSizeMetric{.entries = size_after, .max_size = options_.max_size});
  return content;
}

common::Status CacheManager::put(const std::filesystem::path &path, const std::string &content) {
  const std::string key = cache_key(path);

  const auto info = file_ops_->stat(path);
  if (!info.ok()) {
    invalidate(path);
    return info.status();
  }

  std::vector<std::string> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!consistent_locked()) {
      clear_locked();
      return inconsistency("put");
    }
    bump_version_locked(key);
    store_locked(key, content, info.value(), evicted);
  }
  report_evictions(evicted);
  return common::Status::success();
}

void CacheManager::invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  clear_locked();
}

void CacheManager::invalidate(const std::filesystem::path &path) {
  const std::string key = cache_key(path);
  std::lock_guard<std::mutex> lock(mutex_);
  bump_version_locked(key);
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return;
  }
  lru_.erase(it->second.position);
  entries_.erase(it);
}

bool CacheManager::contains(const std::filesystem::path &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.contains(cache_key(path));
}

std::size_t CacheManager::cleanup_expired() {
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (expired(it->second.entry, now)) {
      lru_.erase(it->second.position);
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

CacheStats CacheManager::stats() const {
  CacheStats out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.hits = hits_;
    out.misses = misses_;
    out.evictions = evictions_;
    out.reloads = reloads_;
    out.total_files = total_files_;
    out.current_size = entries_.size();
    out.max_size = options_.max_size;
    out.last_reset = last_reset_;
  }
  const auto lookups = out.hits + out.misses;
  out.hit_rate = lookups == 0 ? 0.0 : static_cast<double>(out.hits) / static_cast<double>(lookups);
  observer_->record_metric(observability::CacheHitRateMetric{.hit_rate = out.hit_rate});
  return out;
}

void CacheManager::reset_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  hits_ = 0;
  misses_ = 0;
  evictions_ = 0;
  reloads_ = 0;
  last_reset_ = common::now_rfc3339();
}

CacheUsage CacheManager::usage() const {
  CacheUsage out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.entries = entries_.size();
  out.max_size = options_.max_size;
  out.utilization_percent =
      100.0 * static_cast<double>(out.entries) / static_cast<double>(out.max_size);
  for (const auto &[_, slot] : entries_) {
    out.content_bytes += slot.entry.content.size();
  }
  out.content_size = common::format_bytes(out.content_bytes);
  return out;
}

} // namespace memorybank::storage
