#include "memorybank/storage/file_operations.hpp"

#include "memorybank/observability/noop_observer.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <thread>

namespace memorybank::storage {

RetryPolicy RetryPolicy::from_config(const config::RetryConfig &config) {
  RetryPolicy policy;
  policy.max_attempts = std::max<std::uint32_t>(1, config.max_attempts);
  policy.base_delay = std::chrono::milliseconds(config.base_delay_ms);
  policy.max_delay = std::chrono::milliseconds(config.max_delay_ms);
  policy.backoff_factor = std::max(1.0, config.backoff_factor);
  return policy;
}

std::chrono::milliseconds RetryPolicy::delay_after(const std::uint32_t attempt) const {
  const double exponent = attempt == 0 ? 0.0 : static_cast<double>(attempt - 1);
  const double raw = static_cast<double>(base_delay.count()) * std::pow(backoff_factor, exponent);
  const double capped = std::min(raw, static_cast<double>(max_delay.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

bool is_transient_error(const std::error_code &ec) {
  if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
    return false;
  }
  switch (ec.value()) {
  case EAGAIN:
#if EWOULDBLOCK != EAGAIN
  case EWOULDBLOCK:
#endif
  case EBUSY:
  case EMFILE:
  case ENFILE:
  case EINTR:
  case ETIMEDOUT:
    return true;
  default:
    return false;
  }
}

common::ErrorCode map_error_code(const std::error_code &ec) {
  if (is_transient_error(ec)) {
    return common::ErrorCode::TransientIO;
  }
  if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
    return common::ErrorCode::NotFound;
  }
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return common::ErrorCode::PermissionDenied;
  }
  if (ec == std::errc::file_exists) {
    return common::ErrorCode::AlreadyExists;
  }
  return common::ErrorCode::IoError;
}

RetryingFileOperations::RetryingFileOperations(std::shared_ptr<IFileSystem> fs, RetryPolicy policy,
                                               std::shared_ptr<observability::IObserver> observer)
    : fs_(fs != nullptr ? std::move(fs) : std::make_shared<NativeFileSystem>()),
      policy_(policy), observer_(observability::ensure_observer(std::move(observer))) {
  policy_.max_attempts = std::max<std::uint32_t>(1, policy_.max_attempts);
}

common::Status RetryingFileOperations::with_retry(const std::string &operation,
                                                  const std::filesystem::path &path,
                                                  const std::function<std::error_code()> &fn) {
  const auto started = std::chrono::steady_clock::now();
  std::error_code last;

  for (std::uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    last = fn();
    if (!last) {
      observer_->record_metric(observability::OperationLatencyMetric{
          .operation = operation,
          .latency = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - started)});
      return common::Status::success();
    }
    if (!is_transient_error(last)) {
      break;
    }
    if (attempt < policy_.max_attempts) {
      const auto delay = policy_.delay_after(attempt);
      retries_.fetch_add(1, std::memory_order_relaxed);
      observer_->record_event(observability::RetryEvent{.operation = operation,
                                                        .path = path.string(),
                                                        .attempt = attempt,
                                                        .delay = delay,
                                                        .error = last.message()});
      std::this_thread::sleep_for(delay);
    }
  }

  const auto code = map_error_code(last);
  if (last == std::errc::operation_canceled) {
    return common::Status::error(code, operation + " stopped for " + path.string(), last.message());
  }
  errors_.fetch_add(1, std::memory_order_relaxed);
  std::string message = operation + " failed for " + path.string();
  if (code == common::ErrorCode::TransientIO) {
    message += " after " + std::to_string(policy_.max_attempts) + " attempts";
  }
  if (code != common::ErrorCode::NotFound) {
    observer_->record_event(observability::ErrorEvent{
        .component = "file_operations",
        .message = message + ": " + last.message()});
  }
  return common::Status::error(code, std::move(message), last.message());
}

common::Result<std::string> RetryingFileOperations::read(const std::filesystem::path &path) {
  std::string content;
  const auto status = with_retry("read", path, [&] { return fs_->read(path, content); });
  if (!status.ok()) {
    return common::Result<std::string>::failure(status.details());
  }
  reads_.fetch_add(1, std::memory_order_relaxed);
  return common::Result<std::string>::success(std::move(content));
}

common::Result<ChunkedRead> RetryingFileOperations::read_chunked(const std::filesystem::path &path,
                                                                 const std::size_t chunk_size,
                                                                 const ChunkProgress &progress) {
  ChunkedRead result;
  const auto status = with_retry("read", path, [&] {
    result = ChunkedRead{};
    return fs_->read_chunks(path, chunk_size, [&](const std::string_view chunk) {
      result.content.append(chunk);
      ++result.chunks;
      return !progress || progress(result.content.size());
    });
  });
  if (!status.ok()) {
    return common::Result<ChunkedRead>::failure(status.details());
  }
  reads_.fetch_add(1, std::memory_order_relaxed);
  return common::Result<ChunkedRead>::success(std::move(result));
}

common::Status RetryingFileOperations::write(const std::filesystem::path &path,
                                             const std::string &content) {
  auto status = with_retry("write", path, [&] { return fs_->write_atomic(path, content); });
  if (status.ok()) {
    writes_.fetch_add(1, std::memory_order_relaxed);
  }
  return status;
}

common::Status RetryingFileOperations::mkdir(const std::filesystem::path &path) {
  return with_retry("mkdir", path, [&] { return fs_->create_directories(path); });
}

common::Result<FileStat> RetryingFileOperations::stat(const std::filesystem::path &path) {
  FileStat info;
  const auto status = with_retry("stat", path, [&] { return fs_->stat(path, info); });
  if (!status.ok()) {
    return common::Result<FileStat>::failure(status.details());
  }
  return common::Result<FileStat>::success(info);
}

common::Result<bool> RetryingFileOperations::exists(const std::filesystem::path &path) {
  const auto info = stat(path);
  if (info.ok()) {
    return common::Result<bool>::success(true);
  }
  if (info.code() == common::ErrorCode::NotFound) {
    return common::Result<bool>::success(false);
  }
  return common::Result<bool>::failure(info.details());
}

common::Status RetryingFileOperations::remove(const std::filesystem::path &path) {
  return with_retry("remove", path, [&] { return fs_->remove(path); });
}

common::Result<std::vector<std::filesystem::path>>
RetryingFileOperations::list_files(const std::filesystem::path &dir) {
  std::vector<std::filesystem::path> files;
  const auto status = with_retry("list", dir, [&] { return fs_->list_files(dir, files); });
  if (!status.ok()) {
    return common::Result<std::vector<std::filesystem::path>>::failure(status.details());
  }
  std::sort(files.begin(), files.end());
  return common::Result<std::vector<std::filesystem::path>>::success(std::move(files));
}

FileOperationStats RetryingFileOperations::stats() const {
  return FileOperationStats{.reads = reads_.load(),
                            .writes = writes_.load(),
                            .errors = errors_.load(),
                            .retries = retries_.load()};
}

} // namespace memorybank::storage
