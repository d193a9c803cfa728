#pragma once

#include "lxcforge/provision/recipe.hpp"

#include <filesystem>

namespace lxcforge::recipes {

/// Eclipse with the PyDev features, run on the host display through a launcher script.
/// The sandbox is left stopped; the launcher starts it on demand.
class PydevRecipe final : public provision::Recipe {
public:
  explicit PydevRecipe(std::string password) : password_(std::move(password)) {}

  [[nodiscard]] std::string role() const override { return "pydev"; }
  [[nodiscard]] std::string summary() const override;
  [[nodiscard]] std::vector<provision::ConfigMutation>
  pre_start_config(const provision::RecipeContext &context) const override;
  [[nodiscard]] std::vector<provision::Step>
  steps(const provision::RecipeContext &context) const override;
  [[nodiscard]] std::vector<provision::HostAction>
  host_actions(const provision::RecipeContext &context) const override;
  [[nodiscard]] bool needs_container_dir() const override { return true; }
  [[nodiscard]] bool stop_when_done() const override { return true; }
  [[nodiscard]] std::map<std::string, std::string>
  result_fields(const provision::RecipeContext &context) const override;

private:
  std::string password_;
};

[[nodiscard]] std::filesystem::path launcher_path(const provision::RecipeContext &context);

} // namespace lxcforge::recipes
