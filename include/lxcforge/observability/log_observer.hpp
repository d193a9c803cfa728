#pragma once

#include "lxcforge/observability/observer.hpp"

#include <iostream>

namespace lxcforge::observability {

/// Structured `[LEVEL] key=value` lines, written to stderr by default.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out = std::cerr) : out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void flush() override { out_.flush(); }
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::ostream &out_;
};

} // namespace lxcforge::observability
