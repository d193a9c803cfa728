#pragma once

#include "lxcforge/common/result.hpp"
#include "lxcforge/provision/recipe.hpp"
#include "lxcforge/release/resolver.hpp"
#include "lxcforge/sandbox/provider.hpp"

#include <chrono>
#include <string>

namespace lxcforge::provision {

struct ProvisionOptions {
  std::string prefix = "test";
  std::string fallback_release = "jessie";
  std::string host_name;
  // The release field is filled in per run.
  sandbox::DistroParams distro;
  std::chrono::seconds address_timeout{120};
  bool debug = false;
};

/// Drives one recipe against one freshly created sandbox. The sandbox is kept only when
/// every stage succeeds; any failure after creation stops and destroys it.
class Provisioner {
public:
  Provisioner(sandbox::SandboxProvider &provider, release::ReleaseResolver &resolver,
              ProvisionOptions options);

  [[nodiscard]] common::Result<ProvisioningResult> run(const Recipe &recipe);

  [[nodiscard]] static std::string container_name(const std::string &prefix,
                                                  const std::string &role,
                                                  const std::string &release);
  [[nodiscard]] static bool valid_prefix(const std::string &prefix);

private:
  [[nodiscard]] ProvisioningResult provision(const Recipe &recipe);
  void apply_config(const std::string &container, const std::vector<ConfigMutation> &mutations);

  sandbox::SandboxProvider &provider_;
  release::ReleaseResolver &resolver_;
  ProvisionOptions options_;
};

} // namespace lxcforge::provision
