#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace memorybank::observability {

struct FileLoadedEvent {
  std::string path;
  std::uint64_t bytes = 0;
  bool from_cache = false;
};

struct FileCreatedEvent {
  std::string file_type;
  std::string path;
};

struct FileWrittenEvent {
  std::string path;
  std::uint64_t bytes = 0;
};

struct CacheEvictionEvent {
  std::string path;
};

struct RetryEvent {
  std::string operation;
  std::string path;
  std::uint32_t attempt = 0;
  std::chrono::milliseconds delay{0};
  std::string error;
};

struct IndexRebuiltEvent {
  std::size_t entries = 0;
  std::chrono::milliseconds duration{0};
  std::string reason;
};

struct HealthCheckEvent {
  bool healthy = false;
  std::size_t issues = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<FileLoadedEvent, FileCreatedEvent, FileWrittenEvent, CacheEvictionEvent,
                 RetryEvent, IndexRebuiltEvent, HealthCheckEvent, ErrorEvent>;

struct CacheHitRateMetric {
  double hit_rate = 0.0;
};

struct CacheSizeMetric {
  std::size_t entries = 0;
  std::size_t max_size = 0;
};

struct OperationLatencyMetric {
  std::string operation;
  std::chrono::microseconds latency{0};
};

using ObserverMetric = std::variant<CacheHitRateMetric, CacheSizeMetric, OperationLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  // Implementations must tolerate concurrent calls.
  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace memorybank::observability
