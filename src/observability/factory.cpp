#include "lxcforge/observability/factory.hpp"

#include "lxcforge/common/fs.hpp"
#include "lxcforge/observability/log_observer.hpp"
#include "lxcforge/observability/multi_observer.hpp"
#include "lxcforge/observability/noop_observer.hpp"
#include "lxcforge/observability/progress_observer.hpp"

namespace lxcforge::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config, const bool verbose) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const bool logging = backend == "log";

  if (!logging && !verbose) {
    return std::make_unique<NoopObserver>();
  }
  if (logging && !verbose) {
    return std::make_unique<LogObserver>();
  }
  if (!logging) {
    return std::make_unique<ProgressObserver>();
  }

  auto multi = std::make_unique<MultiObserver>();
  multi->add(std::make_unique<ProgressObserver>());
  multi->add(std::make_unique<LogObserver>());
  return multi;
}

} // namespace lxcforge::observability
