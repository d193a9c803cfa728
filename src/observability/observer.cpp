#include "lxcforge/observability/observer.hpp"

namespace lxcforge::observability {

std::string_view sandbox_action_to_string(const SandboxAction action) {
  switch (action) {
  case SandboxAction::Create:
    return "create";
  case SandboxAction::Configure:
    return "configure";
  case SandboxAction::Start:
    return "start";
  case SandboxAction::Address:
    return "address";
  case SandboxAction::Stop:
    return "stop";
  }
  return "unknown";
}

} // namespace lxcforge::observability
