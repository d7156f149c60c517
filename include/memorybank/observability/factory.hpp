#pragma once

#include "memorybank/config/schema.hpp"
#include "memorybank/observability/observer.hpp"

#include <memory>

namespace memorybank::observability {

[[nodiscard]] std::shared_ptr<IObserver> create_observer(const config::Config &config);

} // namespace memorybank::observability
