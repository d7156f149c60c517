#pragma once

#include "memorybank/observability/observer.hpp"

#include <memory>

namespace memorybank::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

// Components accept a null observer; this is what they fall back to.
[[nodiscard]] inline std::shared_ptr<IObserver> ensure_observer(std::shared_ptr<IObserver> observer) {
  if (observer != nullptr) {
    return observer;
  }
  return std::make_shared<NoopObserver>();
}

} // namespace memorybank::observability
