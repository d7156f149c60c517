#pragma once

#include <cstdint>
#include <string>

namespace memorybank::config {

struct StoreConfig {
  // Empty means "./memory-bank" relative to the working directory.
  std::string root;
};

struct CacheConfig {
  std::size_t max_size = 100;
  std::uint64_t max_age_ms = 60ULL * 60ULL * 1000ULL;
  bool enable_metrics = true;
};

struct RetryConfig {
  std::uint32_t max_attempts = 3;
  std::uint64_t base_delay_ms = 100;
  std::uint64_t max_delay_ms = 5000;
  double backoff_factor = 2.0;
};

struct IndexConfig {
  bool enabled = true;
  bool persist = true;
  std::string path = ".index/metadata.db";
  std::uint32_t max_age_hours = 24;
};

// Files at or above size_threshold bytes are read in chunk_size pieces.
struct StreamingConfig {
  std::uint64_t size_threshold = 1024ULL * 1024ULL;
  std::uint64_t chunk_size = 64ULL * 1024ULL;
  std::uint64_t timeout_ms = 30ULL * 1000ULL;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  StoreConfig store;
  CacheConfig cache;
  RetryConfig retry;
  IndexConfig index;
  StreamingConfig streaming;
  ObservabilityConfig observability;
};

} // namespace memorybank::config
