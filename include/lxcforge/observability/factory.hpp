#pragma once

#include "lxcforge/config/schema.hpp"
#include "lxcforge/observability/observer.hpp"

#include <memory>

namespace lxcforge::observability {

/// Builds the observer for a run: the configured log backend, plus progress output
/// when `verbose` is set.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                                         bool verbose);

} // namespace lxcforge::observability
