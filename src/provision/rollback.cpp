#include "lxcforge/provision/rollback.hpp"

#include "lxcforge/observability/global.hpp"

#include <exception>

namespace lxcforge::provision {

SandboxRollback::SandboxRollback(sandbox::SandboxProvider &provider, std::string container)
    : provider_(provider), container_(std::move(container)) {}

SandboxRollback::~SandboxRollback() {
  if (!armed_) {
    return;
  }

  try {
    // A sandbox that never started fails to stop; destroy is still attempted.
    const auto stopped = provider_.stop(container_);
    const auto destroyed = provider_.destroy(container_);
    if (!destroyed.ok()) {
      observability::record_error("rollback", "failed to destroy " + container_ + ": " +
                                                  destroyed.error());
    }
    observability::record_rollback(container_, stopped.ok(), destroyed.ok());
  } catch (const std::exception &ex) {
    observability::record_error("rollback", container_ + ": " + ex.what());
  }
}

} // namespace lxcforge::provision
