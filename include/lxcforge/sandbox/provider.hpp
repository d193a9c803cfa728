#pragma once

#include "lxcforge/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lxcforge::sandbox {

/// Parameters for building the sandbox root filesystem.
struct DistroParams {
  std::string template_name = "download";
  std::string dist = "debian";
  std::string release;
  std::string arch = "amd64";
};

enum class EnvPolicy {
  // Start from an empty environment, then apply the extra variables.
  Clear,
  Keep,
};

/// Standard streams of an attached command. -1 inherits the caller's stream.
struct AttachIo {
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  EnvPolicy env_policy = EnvPolicy::Clear;
  std::vector<std::pair<std::string, std::string>> extra_env = {{"TERM", "xterm"}};
};

/// Lifecycle and execution capability for named sandboxes. All calls are synchronous.
class SandboxProvider {
public:
  virtual ~SandboxProvider() = default;

  [[nodiscard]] virtual bool exists(const std::string &name) = 0;
  [[nodiscard]] virtual bool is_running(const std::string &name) = 0;

  [[nodiscard]] virtual common::Status create(const std::string &name,
                                              const DistroParams &params) = 0;
  [[nodiscard]] virtual common::Status start(const std::string &name) = 0;
  [[nodiscard]] virtual common::Status stop(const std::string &name) = 0;
  [[nodiscard]] virtual common::Status destroy(const std::string &name) = 0;

  /// Polls until the sandbox reports an IPv4 address or `timeout` elapses.
  [[nodiscard]] virtual std::optional<std::string>
  get_address(const std::string &name, std::chrono::seconds timeout) = 0;

  /// Runs `argv` inside the running sandbox and returns its exit status. A failed Result
  /// means the command could not be attached at all.
  [[nodiscard]] virtual common::Result<int> attach_run(const std::string &name,
                                                       const std::vector<std::string> &argv,
                                                       const AttachIo &io) = 0;

  [[nodiscard]] virtual common::Status set_config_item(const std::string &name,
                                                       const std::string &key,
                                                       const std::string &value) = 0;
  [[nodiscard]] virtual common::Status clear_config_item(const std::string &name,
                                                         const std::string &key) = 0;
  [[nodiscard]] virtual common::Status append_config_item(const std::string &name,
                                                          const std::string &key,
                                                          const std::string &value) = 0;
  [[nodiscard]] virtual common::Status save_config(const std::string &name) = 0;

  /// Host directory holding the sandbox's configuration and root filesystem.
  [[nodiscard]] virtual common::Result<std::filesystem::path>
  container_dir(const std::string &name) = 0;
};

} // namespace lxcforge::sandbox
