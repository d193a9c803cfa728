#pragma once

#include "lxcforge/provision/step.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace lxcforge::provision {

/// Values resolved for one run and shared with the recipe.
struct RecipeContext {
  std::string prefix;
  std::string release;
  std::string container_name;
  std::string container_address;
  std::string host_name;
  std::filesystem::path container_dir;
};

/// A fixed provisioning sequence for one kind of service.
class Recipe {
public:
  virtual ~Recipe() = default;

  /// Role tag used in the sandbox name.
  [[nodiscard]] virtual std::string role() const = 0;
  [[nodiscard]] virtual std::string summary() const = 0;

  [[nodiscard]] virtual std::vector<ConfigMutation>
  pre_start_config(const RecipeContext & /*context*/) const {
    return {};
  }
  [[nodiscard]] virtual std::vector<Step> steps(const RecipeContext &context) const = 0;
  [[nodiscard]] virtual std::vector<HostAction>
  host_actions(const RecipeContext & /*context*/) const {
    return {};
  }
  /// Host actions or result fields refer to RecipeContext::container_dir. Otherwise the
  /// directory is never looked up and stays empty.
  [[nodiscard]] virtual bool needs_container_dir() const { return false; }
  /// Leave the sandbox stopped once provisioned.
  [[nodiscard]] virtual bool stop_when_done() const { return false; }

  /// Recipe-specific result fields; the sandbox name and address are added by the caller.
  [[nodiscard]] virtual std::map<std::string, std::string>
  result_fields(const RecipeContext &context) const = 0;
};

} // namespace lxcforge::provision
