#pragma once

#include "memorybank/common/result.hpp"
#include "memorybank/config/schema.hpp"
#include "memorybank/observability/observer.hpp"
#include "memorybank/storage/file_operations.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace memorybank::storage {

struct StreamingOptions {
  std::uintmax_t size_threshold = 1024 * 1024;
  std::size_t chunk_size = 64 * 1024;
  std::chrono::milliseconds timeout{30000};

  [[nodiscard]] static StreamingOptions from_config(const config::StreamingConfig &config);
};

struct StreamingResult {
  std::string content;
  bool was_streamed = false;
  std::chrono::microseconds duration{0};
  std::uintmax_t bytes_read = 0;
  std::size_t chunks_processed = 0;
};

struct StreamingStats {
  std::uint64_t total_operations = 0;
  std::uint64_t streamed_operations = 0;
  std::uintmax_t total_bytes_read = 0;
  double avg_streaming_ms = 0.0;
  double avg_normal_read_ms = 0.0;
  std::uintmax_t largest_file_streamed = 0;
  std::string last_reset;
};

// bytes_read counts from zero again if a failed attempt is retried.
using StreamingProgress = std::function<void(std::uintmax_t bytes_read, std::uintmax_t total_bytes)>;

// Reads small files in one call and files at or above size_threshold in
// chunk_size pieces under a deadline.
class StreamingReader {
public:
  StreamingReader(std::shared_ptr<RetryingFileOperations> file_ops, StreamingOptions options,
                  std::shared_ptr<observability::IObserver> observer = nullptr);

  [[nodiscard]] common::Result<StreamingResult> read(const std::filesystem::path &path,
                                                     const StreamingProgress &progress = {});
  [[nodiscard]] common::Result<bool> would_stream(const std::filesystem::path &path);

  [[nodiscard]] StreamingStats stats() const;
  void reset_stats();
  [[nodiscard]] const StreamingOptions &options() const { return options_; }

private:
  void record(const StreamingResult &result);

  std::shared_ptr<RetryingFileOperations> file_ops_;
  StreamingOptions options_;
  std::shared_ptr<observability::IObserver> observer_;

  mutable std::mutex mutex_;
  StreamingStats stats_;
  std::uint64_t normal_operations_ = 0;
  double streaming_ms_total_ = 0.0;
  double normal_ms_total_ = 0.0;
};

} // namespace memorybank::storage
