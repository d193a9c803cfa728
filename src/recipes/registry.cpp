#include "lxcforge/recipes/registry.hpp"

#include "lxcforge/recipes/django.hpp"
#include "lxcforge/recipes/postgresql.hpp"
#include "lxcforge/recipes/pydev.hpp"

namespace lxcforge::recipes {

std::vector<RecipeInfo> list_recipes() {
  std::vector<RecipeInfo> out;
  for (const auto &name : {"postgresql", "django", "pydev"}) {
    const auto recipe = make_recipe(name, "");
    out.push_back(RecipeInfo{.name = recipe->role(), .summary = recipe->summary()});
  }
  return out;
}

bool is_known_recipe(const std::string &name) { return make_recipe(name, "") != nullptr; }

std::unique_ptr<provision::Recipe> make_recipe(const std::string &name, std::string password) {
  if (name == "postgresql") {
    return std::make_unique<PostgresqlRecipe>(std::move(password));
  }
  if (name == "django") {
    return std::make_unique<DjangoRecipe>(std::move(password));
  }
  if (name == "pydev") {
    return std::make_unique<PydevRecipe>(std::move(password));
  }
  return nullptr;
}

} // namespace lxcforge::recipes
