#pragma once

#include "lxcforge/observability/observer.hpp"

namespace lxcforge::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace lxcforge::observability
