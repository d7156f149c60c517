#include "memorybank/storage/streaming_reader.hpp"

#include "memorybank/common/time.hpp"
#include "memorybank/observability/noop_observer.hpp"

#include <algorithm>

namespace memorybank::storage {

namespace {

double to_ms(const std::chrono::microseconds value) {
  return static_cast<double>(value.count()) / 1000.0;
}

} // namespace

StreamingOptions StreamingOptions::from_config(const config::StreamingConfig &config) {
  return StreamingOptions{
      .size_threshold = static_cast<std::uintmax_t>(config.size_threshold),
      .chunk_size = static_cast<std::size_t>(std::max<std::uint64_t>(1, config.chunk_size)),
      .timeout = std::chrono::milliseconds(std::max<std::uint64_t>(1, config.timeout_ms))};
}

StreamingReader::StreamingReader(std::shared_ptr<RetryingFileOperations> file_ops,
                                 StreamingOptions options,
                                 std::shared_ptr<observability::IObserver> observer)
    : file_ops_(std::move(file_ops)), options_(options),
      observer_(observability::ensure_observer(std::move(observer))) {
  options_.chunk_size = std::max<std::size_t>(1, options_.chunk_size);
  stats_.last_reset = common::now_rfc3339();
}

common::Result<bool> StreamingReader::would_stream(const std::filesystem::path &path) {
  const auto info = file_ops_->stat(path);
  if (!info.ok()) {
    return common::Result<bool>::failure(info.details());
  }
  return common::Result<bool>::success(!info.value().is_directory &&
                                       info.value().size_bytes >= options_.size_threshold);
}

common::Result<StreamingResult> StreamingReader::read(const std::filesystem::path &path,
                                                      const StreamingProgress &progress) {
  const auto started = std::chrono::steady_clock::now();
  const auto info = file_ops_->stat(path);
  if (!info.ok()) {
    return common::Result<StreamingResult>::failure(info.details());
  }
  if (info.value().is_directory) {
    return common::Result<StreamingResult>::failure(common::ErrorCode::IoError,
                                                    "Not a regular file: " + path.string());
  }

  StreamingResult result;
  const auto total = info.value().size_bytes;
  if (total < options_.size_threshold) {
    auto content = file_ops_->read(path);
    if (!content.ok()) {
      return common::Result<StreamingResult>::failure(content.details());
    }
    result.content = std::move(content.value());
    result.bytes_read = result.content.size();
  } else {
    const auto deadline = started + options_.timeout;
    bool timed_out = false;
    auto chunked = file_ops_->read_chunked(path, options_.chunk_size, [&](const std::size_t bytes) {
      if (progress) {
        progress(bytes, total);
      }
      if (std::chrono::steady_clock::now() > deadline) {
        timed_out = true;
        return false;
      }
      return true;
    });
    if (!chunked.ok()) {
      if (timed_out) {
        const std::string message = "Streaming read of " + path.string() + " timed out after " +
                                    std::to_string(options_.timeout.count()) + "ms";
        observer_->record_event(
            observability::ErrorEvent{.component = "streaming", .message = message});
        return common::Result<StreamingResult>::failure(common::ErrorCode::Timeout, message);
      }
      return common::Result<StreamingResult>::failure(chunked.details());
    }
    result.content = std::move(chunked.value().content);
    result.chunks_processed = chunked.value().chunks;
    result.bytes_read = result.content.size();
    result.was_streamed = true;
  }

  result.duration = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started);
  record(result);
  observer_->record_event(observability::FileLoadedEvent{
      .path = path.string(), .bytes = result.bytes_read, .from_cache = false});
  observer_->record_metric(observability::OperationLatencyMetric{
      .operation = result.was_streamed ? "stream" : "read", .latency = result.duration});
  return common::Result<StreamingResult>::success(std::move(result));
}

void StreamingReader::record(const StreamingResult &result) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.total_operations;
  stats_.total_bytes_read += result.bytes_read;
  if (result.was_streamed) {
    ++stats_.streamed_operations;
    streaming_ms_total_ += to_ms(result.duration);
    stats_.avg_streaming_ms = streaming_ms_total_ / static_cast<double>(stats_.streamed_operations);
    stats_.largest_file_streamed = std::max(stats_.largest_file_streamed, result.bytes_read);
  } else {
    ++normal_operations_;
    normal_ms_total_ += to_ms(result.duration);
    stats_.avg_normal_read_ms = normal_ms_total_ / static_cast<double>(normal_operations_);
  }
}

StreamingStats StreamingReader::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void StreamingReader::reset_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_ = StreamingStats{};
  stats_.last_reset = common::now_rfc3339();
  normal_operations_ = 0;
  streaming_ms_total_ = 0.0;
  normal_ms_total_ = 0.0;
}

} // namespace memorybank::storage
