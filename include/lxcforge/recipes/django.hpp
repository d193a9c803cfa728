#pragma once

#include "lxcforge/provision/recipe.hpp"

namespace lxcforge::recipes {

/// Barebones Django project served by nginx and a uWSGI emperor.
class DjangoRecipe final : public provision::Recipe {
public:
  explicit DjangoRecipe(std::string password) : password_(std::move(password)) {}

  [[nodiscard]] std::string role() const override { return "django"; }
  [[nodiscard]] std::string summary() const override;
  [[nodiscard]] std::vector<provision::ConfigMutation>
  pre_start_config(const provision::RecipeContext &context) const override;
  [[nodiscard]] std::vector<provision::Step>
  steps(const provision::RecipeContext &context) const override;
  [[nodiscard]] std::map<std::string, std::string>
  result_fields(const provision::RecipeContext &context) const override;

private:
  std::string password_;
};

[[nodiscard]] std::string project_name(const std::string &prefix);
[[nodiscard]] std::string project_path(const std::string &prefix);

} // namespace lxcforge::recipes
