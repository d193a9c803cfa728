#include "test_framework.hpp"

#include "lxcforge/recipes/django.hpp"
#include "lxcforge/recipes/postgresql.hpp"
#include "lxcforge/recipes/pydev.hpp"
#include "lxcforge/recipes/registry.hpp"
#include "lxcforge/recipes/shared.hpp"
#include "lxcforge/recipes/templates.hpp"

#include <algorithm>

namespace {

using lxcforge::provision::RecipeContext;
using lxcforge::provision::Step;
using lxcforge::provision::StepMode;

RecipeContext context_for(const std::string &role) {
  RecipeContext context;
  context.prefix = "acme";
  context.release = "bookworm";
  context.container_name = "acme_" + role + "_bookworm";
  context.container_address = "10.0.3.17";
  context.host_name = "workstation";
  context.container_dir = "/home/dev/.local/share/lxc/" + context.container_name;
  return context;
}

std::vector<std::string> descriptions(const std::vector<Step> &steps) {
  std::vector<std::string> out;
  for (const auto &step : steps) {
    out.push_back(step.description);
  }
  return out;
}

const Step &find_step(const std::vector<Step> &steps, const std::string &description) {
  const auto it = std::find_if(steps.begin(), steps.end(), [&](const Step &step) {
    return step.description == description;
  });
  if (it == steps.end()) {
    throw std::runtime_error("missing step: " + description);
  }
  return *it;
}

bool has_text(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_recipes_tests(std::vector<lxcforge::tests::TestCase> &tests) {
  using lxcforge::tests::require;
  namespace recipes = lxcforge::recipes;

  tests.push_back({"recipes_shared_naming", [] {
                     require(recipes::user_name("acme") == "acme_user", "user name");
                     require(recipes::user_info("aCME") == "Acme User", "gecos");
                     require(recipes::user_home("acme") == "/home/acme_user", "home");
                     require(recipes::subnet_prefix("10.0.3.17") == "10.0.3.", "subnet");
                     require(recipes::subnet_prefix("192.168.1.1") == "192.168.1.", "subnet 2");
                     require(recipes::fill_template("{a}-{b}-{a}", {{"a", "x"}, {"b", "{a}"}}) ==
                                 "x-{a}-x",
                             "placeholders replaced once");
                   }});

  tests.push_back({"recipes_idmap_mutations", [] {
                     const auto mutations = recipes::idmap_mutations();
                     require(mutations.size() == 2, "clear then append");
                     require(mutations[0].description == "Clearing UID and GID mappings", "clear");
                     require(mutations[0].edits.size() == 1 &&
                                 mutations[0].edits[0].op == lxcforge::provision::ConfigOp::Clear,
                             "single clear edit");
                     require(mutations[1].edits.size() == 6, "six mappings");
                     require(mutations[1].edits[2].value == "u 1000 1000 1", "host uid mapping");
                     require(mutations[1].edits[5].value == "g 1001 101001 64535", "last mapping");
                     for (const auto &edit : mutations[1].edits) {
                       require(edit.key == "lxc.idmap", "key");
                     }
                   }});

  tests.push_back({"recipes_write_file_step_pipes_content", [] {
                     const auto as_user =
                         recipes::write_file_step("Writing", "acme_user", "body\n", "/tmp/x.conf");
                     require(as_user.mode == StepMode::Piped, "piped");
                     require(as_user.host_command ==
                                 std::vector<std::string>{"printf", "%s", "body\n"},
                             "content is printf's argument, not its format");
                     require(as_user.command == std::vector<std::string>{"su", "-", "acme_user",
                                                                         "-c", "cat > '/tmp/x.conf'"},
                             "written as the user");
                     const auto as_root = recipes::write_file_step("Writing", "", "x", "/etc/y");
                     require(as_root.command.front() == "sh", "root writes through sh");
                   }});

  tests.push_back({"recipes_postgresql_steps", [] {
                     recipes::PostgresqlRecipe recipe("Secret12");
                     const auto context = context_for("postgresql");
                     require(recipe.role() == "postgresql", "role");
                     require(recipe.pre_start_config(context).empty(), "no config mutations");
                     require(!recipe.stop_when_done(), "left running");

                     const auto steps = recipe.steps(context);
                     const std::vector<std::string> expected = {
                         "Updating apt",          "Installing packages",
                         "Configuring pg_hba.conf", "Configuring postgresql.conf",
                         "Restarting PostgreSQL daemon", "Creating database user",
                         "Creating database"};
                     require(descriptions(steps) == expected, "postgresql step order");

                     const auto &install = find_step(steps, "Installing packages");
                     require(install.command == std::vector<std::string>{"apt-get", "install", "-y",
                                                                         "postgresql",
                                                                         "postgresql-client"},
                             "packages");

                     const auto &hba = find_step(steps, "Configuring pg_hba.conf");
                     require(hba.mode == StepMode::Piped, "hba line piped in");
                     require(hba.host_command.back() ==
                                 "host\t\tacme_db\t\tacme_user\t\t10.0.3.0/24\t\tmd5\n",
                             "hba entry");

                     const auto &listen = find_step(steps, "Configuring postgresql.conf");
                     require(has_text(listen.command.back(),
                                      "listen_addresses = 'acme_postgresql_bookworm,workstation'"),
                             "listen addresses");
                     require(has_text(listen.command.back(), "grep -q '^#listen_addresses'"),
                             "fails when the commented default is absent");

                     const auto &user = find_step(steps, "Creating database user");
                     require(user.command[2] == "postgres", "runs as postgres");
                     require(has_text(user.command.back(),
                                      "CREATE USER acme_user WITH PASSWORD 'Secret12';"),
                             "create user");
                     const auto &db = find_step(steps, "Creating database");
                     require(has_text(db.command.back(), "CREATE DATABASE acme_db OWNER acme_user;"),
                             "create database");

                     const auto fields = recipe.result_fields(context);
                     require(fields.at("database_name") == "acme_db", "db name");
                     require(fields.at("database_user") == "acme_user", "db user");
                     require(fields.at("database_password") == "Secret12", "db password");
                   }});

  tests.push_back({"recipes_django_steps", [] {
                     recipes::DjangoRecipe recipe("Secret12");
                     const auto context = context_for("django");
                     require(recipe.pre_start_config(context).size() == 2, "id map mutations");

                     const auto steps = recipe.steps(context);
                     require(steps.size() == 20, "twenty steps");
                     require(steps.front().description == "Updating apt", "apt first");
                     require(steps.back().description == "Starting uwsgi service", "uwsgi last");

                     const auto &password = find_step(steps, "Setting user password");
                     require(password.mode == StepMode::Piped, "piped password");
                     require(password.host_command ==
                                 std::vector<std::string>{"echo", "acme_user:Secret12"},
                             "echo user:password");
                     require(password.command == std::vector<std::string>{"chpasswd"}, "chpasswd");

                     const auto &nginx = find_step(steps, "Creating nginx configuration file");
                     const std::string site = nginx.host_command.back();
                     require(has_text(site, "server_name 10.0.3.17;"), "server name");
                     require(has_text(site,
                                      "server unix:///home/acme_user/acme_project/acme_project.sock"),
                             "socket path");
                     require(has_text(site, "alias /home/acme_user/acme_project/static;"),
                             "static alias");
                     require(nginx.command.back() ==
                                 "cat > '/home/acme_user/acme_project/acme_project_nginx.conf'",
                             "site config path");

                     const auto &uwsgi = find_step(steps, "Creating uwsgi configuration file");
                     require(has_text(uwsgi.host_command.back(), "project         = acme_project"),
                             "uwsgi project");
                     require(has_text(uwsgi.host_command.back(), "base            = /home/acme_user"),
                             "uwsgi base");

                     const auto &unit = find_step(steps, "Creating uwsgi service");
                     require(has_text(unit.command.back(), "/lib/systemd/system/uwsgi.service"),
                             "unit path");

                     const auto fields = recipe.result_fields(context);
                     require(fields.at("user_name") == "acme_user", "user");
                     require(fields.at("user_password") == "Secret12", "password");
                     require(fields.at("project_path") == "/home/acme_user/acme_project", "path");
                   }});

  tests.push_back({"recipes_pydev_steps", [] {
                     recipes::PydevRecipe recipe("Secret12");
                     const auto context = context_for("pydev");
                     require(recipe.stop_when_done(), "ends stopped");

                     const auto mutations = recipe.pre_start_config(context);
                     require(mutations.size() == 3, "mount entry plus id maps");
                     require(mutations.front().edits.front().key == "lxc.mount.entry", "mount");
                     require(has_text(mutations.front().edits.front().value,
                                      "/tmp/.X11-unix tmp/.X11-unix none bind,optional,create=dir"),
                             "X11 bind mount");

                     const auto steps = recipe.steps(context);
                     require(steps.size() == 12, "twelve steps");
                     require(steps.front().command ==
                                 std::vector<std::string>{"umount", "/tmp/.X11-unix"},
                             "unmount first");
                     const auto &gui = find_step(steps, "Installing GUI packages");
                     require(gui.command[2] == "--no-install-recommends", "no recommends");
                     const auto &jdk = find_step(steps, "Downloading and extracting Java JDK");
                     require(jdk.mode == StepMode::Piped, "download piped into tar");
                     require(has_text(jdk.command.back(), "tar xz -C jdk --strip-components 1"),
                             "jdk extraction");
                     const auto &ini = find_step(steps, "Updating Eclipse configuration");
                     require(has_text(ini.command.back(),
                                      "/-vmargs/i-data\\n/home/acme_user/workspace\\n-vm\\n"
                                      "/home/acme_user/jdk/bin/java"),
                             "eclipse.ini edit: " + ini.command.back());
                     const auto &pydev = find_step(steps, "Installing PyDev");
                     require(has_text(pydev.command.back(),
                                      "-repository http://pydev.org/updates,"), "repositories");

                     const auto actions = recipe.host_actions(context);
                     require(actions.size() == 2, "write and chmod");
                     require(actions[0].description == "Writing startup script", "write");
                     require(actions[1].description == "Making script executable", "chmod");

                     const auto fields = recipe.result_fields(context);
                     require(fields.at("startup_script") ==
                                 "/home/dev/.local/share/lxc/acme_pydev_bookworm/start-pydev",
                             "script path");
                   }});

  tests.push_back({"recipes_pydev_launcher_script", [] {
                     const std::string script = recipes::render_pydev_launcher(
                         "acme_pydev_bookworm", "/home/dev/.local/share/lxc", "acme_user");
                     require(script.rfind("#!/bin/sh\n", 0) == 0, "shebang");
                     require(has_text(script, "CONTAINER=acme_pydev_bookworm"), "container");
                     require(has_text(script, "LXCPATH='/home/dev/.local/share/lxc'\n"),
                             "lxc path");
                     require(has_text(script, "sudo -u acme_user -i env DISPLAY=$DISPLAY"),
                             "runs as the user");
                     require(has_text(script, "lxc-stop -P \"$LXCPATH\" -n $CONTAINER -t 10"),
                             "stops what it started");
                   }});

  tests.push_back({"recipes_pydev_launcher_quotes_lxc_path", [] {
                     const std::string script = recipes::render_pydev_launcher(
                         "acme_pydev_bookworm", "/srv/my lxc/it's here", "acme_user");
                     require(has_text(script, "LXCPATH='/srv/my lxc/it'\\''s here'\n"),
                             "path is a single shell word: " + script);
                     require(recipes::shell_single_quote("") == "''", "empty word");
                   }});

  tests.push_back({"recipes_registry", [] {
                     const auto listed = recipes::list_recipes();
                     require(listed.size() == 3, "three recipes");
                     require(listed[0].name == "postgresql" && listed[1].name == "django" &&
                                 listed[2].name == "pydev",
                             "order");
                     for (const auto &info : listed) {
                       require(!info.summary.empty(), "summary for " + info.name);
                     }
                     require(recipes::is_known_recipe("django"), "django known");
                     require(!recipes::is_known_recipe("mysql"), "mysql unknown");
                     require(recipes::make_recipe("mysql", "x") == nullptr, "null for unknown");
                     const auto recipe = recipes::make_recipe("pydev", "Secret12");
                     require(recipe != nullptr && recipe->role() == "pydev", "pydev");
                   }});
}
