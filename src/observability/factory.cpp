#include "memorybank/observability/factory.hpp"

#include "memorybank/common/fs.hpp"
#include "memorybank/observability/log_observer.hpp"
#include "memorybank/observability/multi_observer.hpp"
#include "memorybank/observability/noop_observer.hpp"

#include <sstream>

namespace memorybank::observability {

namespace {

std::shared_ptr<IObserver> make_log_observer(const config::Config &config) {
  const auto level = parse_log_level(config.observability.level).value_or(LogLevel::Info);
  return std::make_shared<LogObserver>(level);
}

} // namespace

std::shared_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_shared<NoopObserver>();
  }

  if (backend == "log") {
    return make_log_observer(config);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_shared<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (p == "log") {
        multi->add(make_log_observer(config));
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_shared<NoopObserver>());
      }
    }
    return multi;
  }

  return make_log_observer(config);
}

} // namespace memorybank::observability
