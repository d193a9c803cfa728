#pragma once

#include "lxcforge/provision/recipe.hpp"

namespace lxcforge::recipes {

/// PostgreSQL server reachable from the sandbox's subnet, with one database owned by
/// `<prefix>_user`.
class PostgresqlRecipe final : public provision::Recipe {
public:
  explicit PostgresqlRecipe(std::string password) : password_(std::move(password)) {}

  [[nodiscard]] std::string role() const override { return "postgresql"; }
  [[nodiscard]] std::string summary() const override;
  [[nodiscard]] std::vector<provision::Step>
  steps(const provision::RecipeContext &context) const override;
  [[nodiscard]] std::map<std::string, std::string>
  result_fields(const provision::RecipeContext &context) const override;

private:
  std::string password_;
};

[[nodiscard]] std::string database_name(const std::string &prefix);

/// pg_hba.conf line admitting `user` to `database` from the /24 around `address`.
[[nodiscard]] std::string hba_entry(const std::string &database, const std::string &user,
                                    const std::string &address);

} // namespace lxcforge::recipes
