#include "lxcforge/provision/step.hpp"

#include "lxcforge/common/json_util.hpp"
#include "lxcforge/provision/error.hpp"

namespace lxcforge::provision {

void fail(const std::string &description) { throw ProvisionError(description); }

Step Step::direct(std::string description, std::vector<std::string> command, const bool debug) {
  Step step;
  step.description = std::move(description);
  step.command = std::move(command);
  step.mode = StepMode::Direct;
  step.debug = debug;
  return step;
}

Step Step::piped(std::string description, std::vector<std::string> host_command,
                 std::vector<std::string> command, const bool debug) {
  Step step;
  step.description = std::move(description);
  step.command = std::move(command);
  step.mode = StepMode::Piped;
  step.host_command = std::move(host_command);
  step.debug = debug;
  return step;
}

std::string ProvisioningResult::to_json() const { return common::json_render_flat_object(fields); }

} // namespace lxcforge::provision
