#include "lxcforge/provision/step_runner.hpp"

#include "lxcforge/common/interrupt.hpp"
#include "lxcforge/observability/global.hpp"
#include "lxcforge/provision/error.hpp"
#include "lxcforge/sandbox/process.hpp"

#include <chrono>

namespace lxcforge::provision {

namespace {

constexpr int LAUNCH_FAILURE_STATUS = -1;

} // namespace

StepRunner::StepRunner(sandbox::SandboxProvider &provider, StepRunnerOptions options)
    : provider_(provider), options_(options) {}

ExecutionOutcome StepRunner::run(const std::string &container, const Step &step) {
  if (!provider_.exists(container) || !provider_.is_running(container)) {
    fail("Container does not exist or is not running");
  }

  observability::record_step_start(container, step.description);
  const auto started = std::chrono::steady_clock::now();

  const bool show_output = options_.debug || step.debug;
  sandbox::FileDescriptor null_device;
  if (!show_output) {
    auto opened = sandbox::open_null_device();
    if (!opened.ok()) {
      observability::record_error("step", opened.error());
      fail(step.description);
    }
    null_device = std::move(opened.value());
  }

  sandbox::AttachIo io;
  io.stdout_fd = null_device.get();
  io.stderr_fd = null_device.get();

  const int status = step.mode == StepMode::Piped
                         ? run_piped(container, step, io, null_device.get())
                         : run_direct(container, step, io);

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_step_end(container, step.description, elapsed, status);
  return ExecutionOutcome{.exit_status = status, .description = step.description};
}

void StepRunner::execute(const std::string &container, const Step &step) {
  if (common::interrupted()) {
    fail("Interrupted");
  }
  const auto outcome = run(container, step);
  // The attached command usually dies from the same signal; report the interrupt, not
  // the step.
  if (common::interrupted()) {
    fail("Interrupted");
  }
  if (!outcome.ok()) {
    fail(outcome.description);
  }
}

int StepRunner::run_direct(const std::string &container, const Step &step,
                           const sandbox::AttachIo &io) {
  auto attached = provider_.attach_run(container, step.command, io);
  if (!attached.ok()) {
    observability::record_error("step", step.description + ": " + attached.error());
    return LAUNCH_FAILURE_STATUS;
  }
  return attached.value();
}

int StepRunner::run_piped(const std::string &container, const Step &step, sandbox::AttachIo io,
                          const int null_fd) {
  auto spawned = sandbox::ChildProcess::spawn(
      step.host_command, sandbox::StdioRedirect{.stdin_fd = -1,
                                                .stdout_fd = -1,
                                                .stderr_fd = null_fd,
                                                .pipe_stdout = true});
  if (!spawned.ok()) {
    observability::record_error("step", step.description + ": " + spawned.error());
    fail(step.description);
  }

  sandbox::ChildProcess host = std::move(spawned.value());
  sandbox::FileDescriptor feed = host.take_stdout();
  io.stdin_fd = feed.get();

  const int status = run_direct(container, step, io);

  // Closing our end first lets a host command still writing see EPIPE instead of
  // blocking forever.
  feed.reset();
  auto host_status = host.wait();
  if (!host_status.ok()) {
    observability::record_error("step", step.description + ": " + host_status.error());
  } else if (host_status.value() != 0) {
    observability::record_error("step", step.description + ": host command exited with " +
                                            std::to_string(host_status.value()));
  }
  return status;
}

} // namespace lxcforge::provision
