#pragma once

#include "lxcforge/common/result.hpp"

#include <chrono>
#include <string>
#include <sys/types.h>
#include <vector>

namespace lxcforge::sandbox {

/// Owning wrapper around a POSIX file descriptor.
class FileDescriptor {
public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() { reset(); }

  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;

  FileDescriptor(FileDescriptor &&other) noexcept : fd_(other.release()) {}
  FileDescriptor &operator=(FileDescriptor &&other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  [[nodiscard]] int get() const { return fd_; }
  [[nodiscard]] bool valid() const { return fd_ >= 0; }

  int release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(int fd = -1);

private:
  int fd_ = -1;
};

[[nodiscard]] common::Result<FileDescriptor> open_null_device();

struct CommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

/// Runs a host program to completion and captures its output. `argv[0]` is looked up on
/// PATH.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  [[nodiscard]] virtual common::Result<ProcessResult>
  run(const std::vector<std::string> &argv, const CommandOptions &options = {}) = 0;
};

class CliCommandRunner final : public ICommandRunner {
public:
  [[nodiscard]] common::Result<ProcessResult>
  run(const std::vector<std::string> &argv, const CommandOptions &options = {}) override;
};

/// Where a spawned child's standard streams go. -1 inherits the parent's stream.
struct StdioRedirect {
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  // Connect stdout to a pipe readable through ChildProcess::take_stdout(); overrides
  // stdout_fd.
  bool pipe_stdout = false;
};

/// A running child process. Killed and reaped on destruction unless wait() already
/// collected it.
class ChildProcess {
public:
  [[nodiscard]] static common::Result<ChildProcess> spawn(const std::vector<std::string> &argv,
                                                          const StdioRedirect &redirect = {});

  ChildProcess(ChildProcess &&other) noexcept;
  ChildProcess &operator=(ChildProcess &&other) noexcept;
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;
  ~ChildProcess();

  [[nodiscard]] pid_t pid() const { return pid_; }
  [[nodiscard]] FileDescriptor take_stdout() { return std::move(stdout_read_); }

  /// Blocks until the child exits. Returns its exit status, or -1 when it was killed by
  /// a signal. Fails after killing the child when the wait is interrupted by SIGINT or
  /// SIGTERM under a common::InterruptGuard.
  [[nodiscard]] common::Result<int> wait();

private:
  ChildProcess(pid_t pid, FileDescriptor stdout_read)
      : pid_(pid), stdout_read_(std::move(stdout_read)) {}

  void terminate();

  pid_t pid_ = -1;
  FileDescriptor stdout_read_;
};

[[nodiscard]] std::string describe_command(const std::vector<std::string> &argv);

} // namespace lxcforge::sandbox
