#include "lxcforge/provision/provisioner.hpp"

#include "lxcforge/common/interrupt.hpp"
#include "lxcforge/observability/global.hpp"
#include "lxcforge/provision/error.hpp"
#include "lxcforge/provision/rollback.hpp"
#include "lxcforge/provision/step_runner.hpp"

#include <algorithm>

namespace lxcforge::provision {

namespace {

using observability::SandboxAction;

void check_interrupt() {
  if (common::interrupted()) {
    fail("Interrupted");
  }
}

// Every stage starts here, so a pending SIGINT or SIGTERM stops the run between stages.
void announce(const std::string &container, const std::string &description) {
  check_interrupt();
  observability::record_step_start(container, description);
}

// Reports a failed provider call and aborts with the user-facing description.
void require_ok(const common::Status &status, const std::string &container,
                const SandboxAction action, const std::string &description) {
  observability::record_sandbox(container, action, status.ok(), status.ok() ? "" : status.error());
  if (!status.ok()) {
    fail(description);
  }
}

} // namespace

Provisioner::Provisioner(sandbox::SandboxProvider &provider, release::ReleaseResolver &resolver,
                         ProvisionOptions options)
    : provider_(provider), resolver_(resolver), options_(std::move(options)) {}

std::string Provisioner::container_name(const std::string &prefix, const std::string &role,
                                        const std::string &release) {
  return prefix + "_" + role + "_" + release;
}

bool Provisioner::valid_prefix(const std::string &prefix) {
  return !prefix.empty() && std::all_of(prefix.begin(), prefix.end(), [](const char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
           ch == '_';
  });
}

common::Result<ProvisioningResult> Provisioner::run(const Recipe &recipe) {
  try {
    return common::Result<ProvisioningResult>::success(provision(recipe));
  } catch (const ProvisionError &ex) {
    observability::record_error("provision", ex.what());
    return common::Result<ProvisioningResult>::failure(ex.what());
  }
}

void Provisioner::apply_config(const std::string &container,
                               const std::vector<ConfigMutation> &mutations) {
  for (const auto &mutation : mutations) {
    announce(container, mutation.description);
    for (const auto &edit : mutation.edits) {
      common::Status status = common::Status::success();
      switch (edit.op) {
      case ConfigOp::Clear:
        status = provider_.clear_config_item(container, edit.key);
        break;
      case ConfigOp::Append:
        status = provider_.append_config_item(container, edit.key, edit.value);
        break;
      case ConfigOp::Set:
        status = provider_.set_config_item(container, edit.key, edit.value);
        break;
      }
      require_ok(status, container, SandboxAction::Configure, mutation.description);
    }
  }

  announce(container, "Saving configuration");
  require_ok(provider_.save_config(container), container, SandboxAction::Configure,
             "Saving configuration");
}

ProvisioningResult Provisioner::provision(const Recipe &recipe) {
  if (!valid_prefix(options_.prefix)) {
    fail("Invalid prefix '" + options_.prefix +
         "', use letters, digits and underscores");
  }

  RecipeContext context;
  context.prefix = options_.prefix;
  context.release = release::resolve_or(resolver_, options_.fallback_release);
  context.host_name = options_.host_name;
  context.container_name = container_name(context.prefix, recipe.role(), context.release);
  const std::string &name = context.container_name;

  if (provider_.exists(name)) {
    fail("Container " + name + " already exists");
  }

  announce(name, "Creating filesystem");
  sandbox::DistroParams distro = options_.distro;
  distro.release = context.release;
  require_ok(provider_.create(name, distro), name, SandboxAction::Create, "Creating filesystem");

  SandboxRollback rollback(provider_, name);

  const auto mutations = recipe.pre_start_config(context);
  if (!mutations.empty()) {
    apply_config(name, mutations);
  }

  announce(name, "Starting container");
  require_ok(provider_.start(name), name, SandboxAction::Start, "Starting container");

  announce(name, "Getting IP address");
  const auto address = provider_.get_address(name, options_.address_timeout);
  check_interrupt();
  const bool have_address = address.has_value() && !address->empty();
  observability::record_sandbox(name, SandboxAction::Address, have_address,
                                have_address ? *address : "timed out");
  if (!have_address) {
    fail("Getting IP address");
  }
  context.container_address = *address;

  if (recipe.needs_container_dir()) {
    auto dir = provider_.container_dir(name);
    if (!dir.ok()) {
      observability::record_error("provision", dir.error());
      fail("Locating container directory");
    }
    context.container_dir = dir.value();
  }

  StepRunner runner(provider_, StepRunnerOptions{.debug = options_.debug});
  for (const auto &step : recipe.steps(context)) {
    runner.execute(name, step);
  }
  check_interrupt();

  for (const auto &action : recipe.host_actions(context)) {
    announce(name, action.description);
    const auto status = action.run ? action.run() : common::Status::error("no action");
    if (!status.ok()) {
      observability::record_error("provision", action.description + ": " + status.error());
      fail(action.description);
    }
  }

  if (recipe.stop_when_done()) {
    announce(name, "Stopping container");
    require_ok(provider_.stop(name), name, SandboxAction::Stop, "Stopping container");
  }

  rollback.disarm();

  ProvisioningResult result;
  result.fields = recipe.result_fields(context);
  result.fields["container_name"] = name;
  result.fields["container_address"] = context.container_address;
  return result;
}

} // namespace lxcforge::provision
