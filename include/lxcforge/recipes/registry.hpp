#pragma once

#include "lxcforge/provision/recipe.hpp"

#include <memory>
#include <string>
#include <vector>

namespace lxcforge::recipes {

struct RecipeInfo {
  std::string name;
  std::string summary;
};

[[nodiscard]] std::vector<RecipeInfo> list_recipes();
[[nodiscard]] bool is_known_recipe(const std::string &name);

/// nullptr for an unknown name. `password` becomes the recipe's generated credential.
[[nodiscard]] std::unique_ptr<provision::Recipe> make_recipe(const std::string &name,
                                                             std::string password);

} // namespace lxcforge::recipes
