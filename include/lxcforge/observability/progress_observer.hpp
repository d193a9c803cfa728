#pragma once

#include "lxcforge/observability/observer.hpp"

#include <iostream>

namespace lxcforge::observability {

/// Verbose mode output: one `<description>...` line before each step.
class ProgressObserver final : public IObserver {
public:
  explicit ProgressObserver(std::ostream &out = std::cout) : out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void flush() override { out_.flush(); }
  [[nodiscard]] std::string_view name() const override { return "progress"; }

private:
  std::ostream &out_;
};

} // namespace lxcforge::observability
