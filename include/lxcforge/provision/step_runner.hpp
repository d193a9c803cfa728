#pragma once

#include "lxcforge/provision/step.hpp"
#include "lxcforge/sandbox/provider.hpp"

namespace lxcforge::provision {

struct StepRunnerOptions {
  // Show the output of every step, not only those marked debug.
  bool debug = false;
};

/// Executes steps inside a running sandbox.
class StepRunner {
public:
  explicit StepRunner(sandbox::SandboxProvider &provider, StepRunnerOptions options = {});

  /// Runs one step and reports its exit status. An attach failure is reported as a
  /// non-zero status. Throws ProvisionError when the sandbox is missing or stopped, or
  /// when a piped step's host command cannot be launched.
  [[nodiscard]] ExecutionOutcome run(const std::string &container, const Step &step);

  /// run(), throwing ProvisionError(step.description) on a non-zero status, or
  /// ProvisionError("Interrupted") when SIGINT or SIGTERM arrived before or during the step.
  void execute(const std::string &container, const Step &step);

private:
  [[nodiscard]] int run_direct(const std::string &container, const Step &step,
                               const sandbox::AttachIo &io);
  [[nodiscard]] int run_piped(const std::string &container, const Step &step,
                              sandbox::AttachIo io, int null_fd);

  sandbox::SandboxProvider &provider_;
  StepRunnerOptions options_;
};

} // namespace lxcforge::provision
