#include "test_framework.hpp"

#include "memorybank/observability/factory.hpp"
#include "memorybank/observability/log_observer.hpp"
#include "memorybank/observability/multi_observer.hpp"
#include "memorybank/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

void register_observability_tests(std::vector<memorybank::tests::TestCase> &tests) {
  using memorybank::tests::require;
  namespace obs = memorybank::observability;
  namespace mt = memorybank::testing;

  tests.push_back({"log_observer_filters_below_min_level", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Info, out);
                     observer.record_event(obs::FileLoadedEvent{.path = "core/projectBrief.md",
                                                                .bytes = 10,
                                                                .from_cache = false});
                     observer.record_event(obs::FileCreatedEvent{.file_type = "projectBrief",
                                                                 .path = "core/projectBrief.md"});
                     observer.record_metric(obs::CacheHitRateMetric{.hit_rate = 0.5});
                     observer.flush();

                     const auto text = out.str();
                     require(text.find("file.loaded") == std::string::npos,
                             "debug event should be filtered");
                     require(text.find("metric.cache_hit_rate") == std::string::npos,
                             "debug metric should be filtered");
                     require(text ==
                                 "[INFO] file.created type=projectBrief path=core/projectBrief.md\n",
                             "unexpected log output: " + text);
                   }});

  tests.push_back({"log_observer_debug_shows_metrics_and_retries", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Debug, out);
                     observer.record_metric(obs::CacheHitRateMetric{.hit_rate = 0.25});
                     observer.record_event(obs::RetryEvent{.operation = "read",
                                                           .path = "/bank/a.md",
                                                           .attempt = 2,
                                                           .delay = std::chrono::milliseconds(200),
                                                           .error = "busy"});
                     observer.record_event(
                         obs::ErrorEvent{.component = "cache", .message = "diverged"});

                     const auto text = out.str();
                     require(text.find("[DEBUG] metric.cache_hit_rate=0.250") != std::string::npos,
                             "hit rate line missing: " + text);
                     require(text.find("[WARN] io.retry op=read path=/bank/a.md attempt=2 "
                                       "delay_ms=200 error=busy") != std::string::npos,
                             "retry line missing: " + text);
                     require(text.find("[ERROR] cache: diverged") != std::string::npos,
                             "error line missing: " + text);
                   }});

  tests.push_back({"parse_log_level_accepts_aliases", [] {
                     require(obs::parse_log_level("DEBUG") == obs::LogLevel::Debug, "debug");
                     require(obs::parse_log_level(" warning ") == obs::LogLevel::Warn, "warning");
                     require(!obs::parse_log_level("loud").has_value(), "unknown level");
                     require(obs::log_level_name(obs::LogLevel::Error) == "ERROR", "name");
                   }});

  tests.push_back({"factory_selects_backend", [] {
                     memorybank::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none should be noop");

                     config.observability.backend = "log";
                     config.observability.level = "error";
                     const auto log = obs::create_observer(config);
                     require(log->name() == "log", "log backend expected");
                     const auto *typed = dynamic_cast<obs::LogObserver *>(log.get());
                     require(typed != nullptr && typed->min_level() == obs::LogLevel::Error,
                             "level should carry through");

                     config.observability.backend = "log, noop";
                     const auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "list should build a multi observer");
                     const auto *fan = dynamic_cast<obs::MultiObserver *>(multi.get());
                     require(fan != nullptr && fan->size() == 2, "both backends expected");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto first = std::make_shared<mt::RecordingObserver>();
                     auto second = std::make_shared<mt::RecordingObserver>();
                     obs::MultiObserver multi;
                     multi.add(first);
                     multi.add(second);
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observers are skipped");

                     multi.record_event(obs::CacheEvictionEvent{.path = "a"});
                     multi.record_metric(obs::CacheSizeMetric{.entries = 1, .max_size = 2});
                     require(first->events().size() == 1 && second->events().size() == 1,
                             "event should reach both");
                     require(first->metrics_of<obs::CacheSizeMetric>().size() == 1,
                             "metric should reach first");
                   }});

  tests.push_back({"ensure_observer_substitutes_noop", [] {
                     require(obs::ensure_observer(nullptr)->name() == "noop",
                             "null should become noop");
                     auto recording = std::make_shared<mt::RecordingObserver>();
                     require(obs::ensure_observer(recording) == recording,
                             "non-null observer should pass through");
                   }});
}
