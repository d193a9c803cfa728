#include "lxcforge/recipes/postgresql.hpp"

#include "lxcforge/recipes/shared.hpp"

namespace lxcforge::recipes {

namespace {

// Resolves the cluster's config file whatever the installed major version is, and fails
// when none exists.
std::string locate_config(const std::string &file) {
  return "f=$(ls -1 /etc/postgresql/*/main/" + file + " 2>/dev/null | head -n 1); [ -n \"$f\" ]";
}

std::string psql(const std::string &statement) { return "psql -c \"" + statement + "\""; }

} // namespace

std::string database_name(const std::string &prefix) { return prefix + "_db"; }

std::string hba_entry(const std::string &database, const std::string &user,
                      const std::string &address) {
  return "host\t\t" + database + "\t\t" + user + "\t\t" + subnet_prefix(address) +
         "0/24\t\tmd5\n";
}

std::string PostgresqlRecipe::summary() const {
  return "PostgreSQL server with a database and user for the prefix";
}

std::vector<provision::Step>
PostgresqlRecipe::steps(const provision::RecipeContext &context) const {
  const std::string user = user_name(context.prefix);
  const std::string database = database_name(context.prefix);
  const std::string listen =
      "listen_addresses = '" + context.container_name + "," + context.host_name + "'";

  return {
      apt_update_step(),
      apt_install_step("Installing packages", {"postgresql", "postgresql-client"}),
      provision::Step::piped("Configuring pg_hba.conf",
                             {"printf", "%s", hba_entry(database, user, context.container_address)},
                             {"bash", "-c", locate_config("pg_hba.conf") + " && cat >> \"$f\""}),
      provision::Step::direct(
          "Configuring postgresql.conf",
          {"bash", "-c",
           locate_config("postgresql.conf") + " && grep -q '^#listen_addresses' \"$f\" && " +
               "sed -i \"s/^#listen_addresses.*/" + listen + "/\" \"$f\""}),
      provision::Step::direct("Restarting PostgreSQL daemon",
                              {"systemctl", "restart", "postgresql"}),
      as_user_step("Creating database user", "postgres",
                   psql("CREATE USER " + user + " WITH PASSWORD '" + password_ + "';")),
      as_user_step("Creating database", "postgres",
                   psql("CREATE DATABASE " + database + " OWNER " + user + ";")),
  };
}

std::map<std::string, std::string>
PostgresqlRecipe::result_fields(const provision::RecipeContext &context) const {
  return {
      {"database_name", database_name(context.prefix)},
      {"database_user", user_name(context.prefix)},
      {"database_password", password_},
  };
}

} // namespace lxcforge::recipes
