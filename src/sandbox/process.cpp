#include "lxcforge/sandbox/process.hpp"

#include "lxcforge/common/interrupt.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lxcforge::sandbox {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    return;
  }
}

common::Status make_pipe(FileDescriptor &read_end, FileDescriptor &write_end) {
  int fds[2] = {-1, -1};
  if (pipe2(fds, O_CLOEXEC) != 0) {
    return common::Status::error(std::string("failed to create pipe: ") + std::strerror(errno));
  }
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return common::Status::success();
}

void redirect_stream(const int source, const int target) {
  if (source >= 0 && source != target) {
    (void)dup2(source, target);
  }
}

// Only returns control to the caller's process image on exec failure, after reporting
// errno through report_fd.
[[noreturn]] void exec_child(const std::vector<std::string> &argv, const int report_fd) {
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  execvp(args[0], args.data());
  const int error = errno;
  (void)!write(report_fd, &error, sizeof(error));
  _exit(127);
}

common::Status read_exec_report(const FileDescriptor &report, const std::string &program) {
  int error = 0;
  ssize_t bytes = 0;
  do {
    bytes = read(report.get(), &error, sizeof(error));
  } while (bytes < 0 && errno == EINTR);

  if (bytes == static_cast<ssize_t>(sizeof(error))) {
    return common::Status::error("failed to launch " + program + ": " + std::strerror(error));
  }
  return common::Status::success();
}

int decode_wait_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}

} // namespace

void FileDescriptor::reset(const int fd) {
  if (fd_ >= 0) {
    (void)close(fd_);
  }
  fd_ = fd;
}

common::Result<FileDescriptor> open_null_device() {
  const int fd = open("/dev/null", O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    return common::Result<FileDescriptor>::failure(std::string("failed to open /dev/null: ") +
                                                   std::strerror(errno));
  }
  return common::Result<FileDescriptor>::success(FileDescriptor(fd));
}

std::string describe_command(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

common::Result<ProcessResult> CliCommandRunner::run(const std::vector<std::string> &argv,
                                                    const CommandOptions &options) {
  if (argv.empty()) {
    return common::Result<ProcessResult>::failure("command is empty");
  }

  FileDescriptor stdout_read;
  FileDescriptor stdout_write;
  FileDescriptor stderr_read;
  FileDescriptor stderr_write;
  FileDescriptor report_read;
  FileDescriptor report_write;
  if (auto made = make_pipe(stdout_read, stdout_write); !made.ok()) {
    return common::Result<ProcessResult>::failure(made.error());
  }
  if (auto made = make_pipe(stderr_read, stderr_write); !made.ok()) {
    return common::Result<ProcessResult>::failure(made.error());
  }
  if (auto made = make_pipe(report_read, report_write); !made.ok()) {
    return common::Result<ProcessResult>::failure(made.error());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<ProcessResult>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    (void)dup2(stdout_write.get(), STDOUT_FILENO);
    (void)dup2(stderr_write.get(), STDERR_FILENO);
    exec_child(argv, report_write.get());
  }

  stdout_write.reset();
  stderr_write.reset();
  report_write.reset();

  if (auto launched = read_exec_report(report_read, argv.front()); !launched.ok()) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    return common::Result<ProcessResult>::failure(launched.error());
  }

  set_non_blocking(stdout_read.get());
  set_non_blocking(stderr_read.get());

  std::string stdout_text;
  std::string stderr_text;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    read_into_buffer(stdout_read.get(), stdout_text);
    read_into_buffer(stderr_read.get(), stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > options.timeout) {
      timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_read.get(), .events = POLLIN, .revents = 0},
        {.fd = stderr_read.get(), .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_into_buffer(stdout_read.get(), stdout_text);
  read_into_buffer(stderr_read.get(), stderr_text);

  ProcessResult result;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.exit_code = decode_wait_status(status);

  if (timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return common::Result<ProcessResult>::failure("command timed out: " +
                                                    describe_command(argv));
    }
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "command failed: " + describe_command(argv)
                                    : result.stderr_text;
    return common::Result<ProcessResult>::failure(message);
  }

  return common::Result<ProcessResult>::success(std::move(result));
}

common::Result<ChildProcess> ChildProcess::spawn(const std::vector<std::string> &argv,
                                                 const StdioRedirect &redirect) {
  if (argv.empty()) {
    return common::Result<ChildProcess>::failure("command is empty");
  }

  FileDescriptor stdout_read;
  FileDescriptor stdout_write;
  if (redirect.pipe_stdout) {
    if (auto made = make_pipe(stdout_read, stdout_write); !made.ok()) {
      return common::Result<ChildProcess>::failure(made.error());
    }
  }

  FileDescriptor report_read;
  FileDescriptor report_write;
  if (auto made = make_pipe(report_read, report_write); !made.ok()) {
    return common::Result<ChildProcess>::failure(made.error());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<ChildProcess>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    const int stdout_target = redirect.pipe_stdout ? stdout_write.get() : redirect.stdout_fd;
    redirect_stream(redirect.stdin_fd, STDIN_FILENO);
    redirect_stream(stdout_target, STDOUT_FILENO);
    redirect_stream(redirect.stderr_fd, STDERR_FILENO);
    for (const int fd : {redirect.stdin_fd, stdout_target, redirect.stderr_fd}) {
      if (fd > STDERR_FILENO) {
        (void)close(fd);
      }
    }
    exec_child(argv, report_write.get());
  }

  stdout_write.reset();
  report_write.reset();

  ChildProcess child(pid, std::move(stdout_read));
  if (auto launched = read_exec_report(report_read, argv.front()); !launched.ok()) {
    // The child has already exited with 127; collect it before reporting.
    (void)child.wait();
    return common::Result<ChildProcess>::failure(launched.error());
  }
  return common::Result<ChildProcess>::success(std::move(child));
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : pid_(other.pid_), stdout_read_(std::move(other.stdout_read_)) {
  other.pid_ = -1;
}

ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept {
  if (this != &other) {
    terminate();
    pid_ = other.pid_;
    stdout_read_ = std::move(other.stdout_read_);
    other.pid_ = -1;
  }
  return *this;
}

ChildProcess::~ChildProcess() { terminate(); }

void ChildProcess::terminate() {
  if (pid_ <= 0) {
    return;
  }
  (void)kill(pid_, SIGKILL);
  int status = 0;
  while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
  pid_ = -1;
}

common::Result<int> ChildProcess::wait() {
  if (pid_ <= 0) {
    return common::Result<int>::failure("process already collected");
  }

  int status = 0;
  pid_t waited = -1;
  while (true) {
    if (common::interrupted()) {
      terminate();
      return common::Result<int>::failure("interrupted");
    }
    waited = waitpid(pid_, &status, 0);
    if (waited >= 0 || errno != EINTR) {
      break;
    }
  }

  pid_ = -1;
  if (waited < 0) {
    return common::Result<int>::failure(std::string("waitpid failed: ") + std::strerror(errno));
  }
  return common::Result<int>::success(decode_wait_status(status));
}

} // namespace lxcforge::sandbox
