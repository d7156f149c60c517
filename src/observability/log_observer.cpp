#include "memorybank/observability/log_observer.hpp"

#include "memorybank/common/fs.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace memorybank::observability {

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, FileLoadedEvent>) {
          log_line(LogLevel::Debug, "file.loaded path=" + evt.path +
                                        " bytes=" + std::to_string(evt.bytes) +
                                        " cached=" + (evt.from_cache ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, FileCreatedEvent>) {
          log_line(LogLevel::Info, "file.created type=" + evt.file_type + " path=" + evt.path);
        } else if constexpr (std::is_same_v<T, FileWrittenEvent>) {
          log_line(LogLevel::Info,
                   "file.written path=" + evt.path + " bytes=" + std::to_string(evt.bytes));
        } else if constexpr (std::is_same_v<T, CacheEvictionEvent>) {
          log_line(LogLevel::Debug, "cache.evict path=" + evt.path);
        } else if constexpr (std::is_same_v<T, RetryEvent>) {
          log_line(LogLevel::Warn, "io.retry op=" + evt.operation + " path=" + evt.path +
                                       " attempt=" + std::to_string(evt.attempt) +
                                       " delay_ms=" + std::to_string(evt.delay.count()) +
                                       " error=" + evt.error);
        } else if constexpr (std::is_same_v<T, IndexRebuiltEvent>) {
          log_line(LogLevel::Info, "index.rebuilt entries=" + std::to_string(evt.entries) +
                                       " duration_ms=" + std::to_string(evt.duration.count()) +
                                       " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, HealthCheckEvent>) {
          log_line(evt.healthy ? LogLevel::Info : LogLevel::Warn,
                   std::string("health.check healthy=") + (evt.healthy ? "true" : "false") +
                       " issues=" + std::to_string(evt.issues));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CacheHitRateMetric>) {
          std::ostringstream rate;
          rate << std::fixed << std::setprecision(3) << m.hit_rate;
          log_line(LogLevel::Debug, "metric.cache_hit_rate=" + rate.str());
        } else if constexpr (std::is_same_v<T, CacheSizeMetric>) {
          log_line(LogLevel::Debug, "metric.cache_size=" + std::to_string(m.entries) + "/" +
                                        std::to_string(m.max_size));
        } else if constexpr (std::is_same_v<T, OperationLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.latency_us op=" + m.operation + " value=" +
                                        std::to_string(m.latency.count()));
        }
      },
      metric);
}

} // namespace memorybank::observability
