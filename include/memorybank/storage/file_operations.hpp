#pragma once

#include "memorybank/common/result.hpp"
#include "memorybank/config/schema.hpp"
#include "memorybank/observability/observer.hpp"
#include "memorybank/storage/file_system.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace memorybank::storage {

struct RetryPolicy {
  std::uint32_t max_attempts = 3;
  std::chrono::milliseconds base_delay{100};
  std::chrono::milliseconds max_delay{5000};
  double backoff_factor = 2.0;

  [[nodiscard]] static RetryPolicy from_config(const config::RetryConfig &config);
  // Delay slept after the given 1-based failed attempt.
  [[nodiscard]] std::chrono::milliseconds delay_after(std::uint32_t attempt) const;
};

struct FileOperationStats {
  std::uint64_t reads = 0;
  std::uint64_t writes = 0;
  std::uint64_t errors = 0;
  std::uint64_t retries = 0;
};

struct ChunkedRead {
  std::string content;
  std::size_t chunks = 0;
};

// Called after every chunk with the bytes read so far in the current attempt.
// Returning false stops the read.
using ChunkProgress = std::function<bool(std::size_t bytes_read)>;

[[nodiscard]] bool is_transient_error(const std::error_code &ec);
[[nodiscard]] common::ErrorCode map_error_code(const std::error_code &ec);

class RetryingFileOperations {
public:
  RetryingFileOperations(std::shared_ptr<IFileSystem> fs, RetryPolicy policy,
                         std::shared_ptr<observability::IObserver> observer = nullptr);

  [[nodiscard]] common::Result<std::string> read(const std::filesystem::path &path);
  // A failed attempt restarts from the first chunk. A read stopped by `progress`
  // fails with IoError and is not retried.
  [[nodiscard]] common::Result<ChunkedRead> read_chunked(const std::filesystem::path &path,
                                                         std::size_t chunk_size,
                                                         const ChunkProgress &progress = {});
  [[nodiscard]] common::Status write(const std::filesystem::path &path, const std::string &content);
  [[nodiscard]] common::Status mkdir(const std::filesystem::path &path);
  [[nodiscard]] common::Result<FileStat> stat(const std::filesystem::path &path);
  // NotFound maps to false; any other failure is returned.
  [[nodiscard]] common::Result<bool> exists(const std::filesystem::path &path);
  [[nodiscard]] common::Status remove(const std::filesystem::path &path);
  [[nodiscard]] common::Result<std::vector<std::filesystem::path>>
  list_files(const std::filesystem::path &dir);

  [[nodiscard]] FileOperationStats stats() const;
  [[nodiscard]] const RetryPolicy &policy() const { return policy_; }

private:
  [[nodiscard]] common::Status with_retry(const std::string &operation,
                                          const std::filesystem::path &path,
                                          const std::function<std::error_code()> &fn);

  std::shared_ptr<IFileSystem> fs_;
  RetryPolicy policy_;
  std::shared_ptr<observability::IObserver> observer_;

  std::atomic<std::uint64_t> reads_{0};
  std::atomic<std::uint64_t> writes_{0};
  std::atomic<std::uint64_t> errors_{0};
  std::atomic<std::uint64_t> retries_{0};
};

} // namespace memorybank::storage
