#pragma once

#include "lxcforge/sandbox/process.hpp"
#include "lxcforge/sandbox/provider.hpp"

#include <memory>
#include <unordered_map>

namespace lxcforge::sandbox {

struct LxcProviderOptions {
  // Passed to every tool as -P when set; otherwise lxc-config decides.
  std::string lxc_path;
  std::chrono::milliseconds poll_interval{1'000};
  std::chrono::seconds command_timeout{1'800};
};

[[nodiscard]] std::vector<std::string> build_lxc_create_args(const std::string &name,
                                                             const DistroParams &params,
                                                             const std::string &lxc_path = "");

[[nodiscard]] std::vector<std::string> build_lxc_attach_args(const std::string &name,
                                                             const std::vector<std::string> &argv,
                                                             const AttachIo &io,
                                                             const std::string &lxc_path = "");

/// First line of `lxc-info -i -H` output that is a dotted-quad IPv4 address.
[[nodiscard]] std::optional<std::string> parse_first_ipv4(const std::string &lxc_info_output);

/// SandboxProvider backed by the lxc-* command line tools.
class LxcProvider final : public SandboxProvider {
public:
  explicit LxcProvider(LxcProviderOptions options,
                       std::shared_ptr<ICommandRunner> runner = std::make_shared<CliCommandRunner>());

  [[nodiscard]] bool exists(const std::string &name) override;
  [[nodiscard]] bool is_running(const std::string &name) override;

  [[nodiscard]] common::Status create(const std::string &name, const DistroParams &params) override;
  [[nodiscard]] common::Status start(const std::string &name) override;
  [[nodiscard]] common::Status stop(const std::string &name) override;
  [[nodiscard]] common::Status destroy(const std::string &name) override;

  [[nodiscard]] std::optional<std::string> get_address(const std::string &name,
                                                       std::chrono::seconds timeout) override;

  [[nodiscard]] common::Result<int> attach_run(const std::string &name,
                                               const std::vector<std::string> &argv,
                                               const AttachIo &io) override;

  [[nodiscard]] common::Status set_config_item(const std::string &name, const std::string &key,
                                               const std::string &value) override;
  [[nodiscard]] common::Status clear_config_item(const std::string &name,
                                                 const std::string &key) override;
  [[nodiscard]] common::Status append_config_item(const std::string &name, const std::string &key,
                                                  const std::string &value) override;
  [[nodiscard]] common::Status save_config(const std::string &name) override;

  [[nodiscard]] common::Result<std::filesystem::path>
  container_dir(const std::string &name) override;

private:
  struct ConfigFile {
    std::filesystem::path path;
    std::vector<std::string> lines;
  };

  struct ContainerState {
    bool exists = false;
    bool running = false;
  };

  [[nodiscard]] std::vector<std::string> tool(const std::string &program,
                                              const std::string &name) const;
  [[nodiscard]] common::Status run_tool(const std::vector<std::string> &args,
                                        std::chrono::milliseconds timeout);
  [[nodiscard]] ContainerState inspect(const std::string &name);
  [[nodiscard]] common::Result<std::filesystem::path> lxc_path();
  [[nodiscard]] common::Result<ConfigFile *> config_file(const std::string &name);

  LxcProviderOptions options_;
  std::shared_ptr<ICommandRunner> runner_;
  std::optional<std::filesystem::path> resolved_lxc_path_;
  std::unordered_map<std::string, ConfigFile> config_files_;
};

} // namespace lxcforge::sandbox
