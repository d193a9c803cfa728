#include "test_framework.hpp"

#include "lxcforge/cli/commands.hpp"
#include "lxcforge/config/config.hpp"
#include "lxcforge/observability/global.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

namespace {

int run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = args;
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }
  return lxcforge::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

struct ProvisionRun {
  int code = 0;
  std::string out;
  std::string err;
};

ProvisionRun provision(const lxcforge::cli::ProvisionRequest &request,
                       lxcforge::testing::FakeSandboxProvider &provider,
                       const lxcforge::config::Config &config = lxcforge::testing::mock_config()) {
  lxcforge::release::FixedReleaseResolver resolver(config.release.pinned.value_or("bookworm"));
  std::ostringstream out;
  std::ostringstream err;
  ProvisionRun run;
  run.code = lxcforge::cli::run_provision(request, config, provider, resolver, "workstation", out,
                                          err);
  lxcforge::observability::set_global_observer(nullptr);
  run.out = out.str();
  run.err = err.str();
  return run;
}

} // namespace

void register_cli_tests(std::vector<lxcforge::tests::TestCase> &tests) {
  using lxcforge::tests::require;
  namespace cli = lxcforge::cli;

  tests.push_back({"cli_parse_flags_and_prefix", [] {
                     const auto parsed = cli::parse_provision_args("django", {"-v", "acme", "--debug"});
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().recipe == "django", "recipe");
                     require(parsed.value().verbose && parsed.value().debug, "flags");
                     require(parsed.value().prefix == std::optional<std::string>("acme"), "prefix");

                     const auto bare = cli::parse_provision_args("pydev", {});
                     require(bare.ok(), bare.error());
                     require(!bare.value().prefix.has_value(), "prefix defaults later");
                     require(!bare.value().verbose && !bare.value().debug, "no flags");
                   }});

  tests.push_back({"cli_parse_rejects_extra_arguments", [] {
                     require(!cli::parse_provision_args("django", {"a", "b"}).ok(), "two prefixes");
                     require(!cli::parse_provision_args("django", {"--fast"}).ok(),
                             "unknown option");
                   }});

  tests.push_back({"cli_provision_prints_sorted_json", [] {
                     lxcforge::testing::FakeSandboxProvider provider;
                     cli::ProvisionRequest request{.recipe = "postgresql",
                                                   .prefix = std::string("acme"),
                                                   .verbose = false,
                                                   .debug = false};
                     const auto run = provision(request, provider);
                     require(run.code == 0, "exit 0: " + run.err);
                     require(run.err.empty(), "nothing on stderr");
                     require(run.out.rfind("{\n    \"container_address\": \"10.0.3.17\",\n"
                                           "    \"container_name\": \"acme_postgresql_bookworm\",\n"
                                           "    \"database_name\": \"acme_db\",\n",
                                           0) == 0,
                             "json: " + run.out);
                     require(run.out.find("\"database_user\": \"acme_user\"\n}\n") !=
                                 std::string::npos,
                             "last member and closing brace");
                   }});

  tests.push_back({"cli_provision_uses_default_prefix", [] {
                     lxcforge::testing::FakeSandboxProvider provider;
                     auto config = lxcforge::testing::mock_config();
                     config.default_prefix = "team";
                     const auto run = provision(cli::ProvisionRequest{.recipe = "django"}, provider,
                                                config);
                     require(run.code == 0, run.err);
                     require(run.out.find("team_django_bookworm") != std::string::npos,
                             "default prefix in name");
                   }});

  tests.push_back({"cli_provision_failure_prints_error_line", [] {
                     lxcforge::testing::FakeSandboxProvider provider;
                     provider.fail_attach_at = 2;
                     const auto run = provision(
                         cli::ProvisionRequest{.recipe = "postgresql", .prefix = std::string("acme")},
                         provider);
                     require(run.code == 1, "exit 1");
                     require(run.err == "Error: Installing packages!\n", "stderr: " + run.err);
                     require(run.out.empty(), "no JSON on failure");
                     require(provider.called("stop") && provider.called("destroy"), "rolled back");
                   }});

  tests.push_back({"cli_provision_existing_container_message", [] {
                     lxcforge::testing::FakeSandboxProvider provider;
                     provider.pre_existing = true;
                     const auto run = provision(
                         cli::ProvisionRequest{.recipe = "pydev", .prefix = std::string("acme")},
                         provider);
                     require(run.code == 1, "exit 1");
                     require(run.err == "Error: Container acme_pydev_bookworm already exists!\n",
                             "stderr: " + run.err);
                   }});

  tests.push_back({"cli_provision_unknown_recipe", [] {
                     lxcforge::testing::FakeSandboxProvider provider;
                     const auto run = provision(cli::ProvisionRequest{.recipe = "mysql"}, provider);
                     require(run.code == 1, "exit 1");
                     require(run.err == "Error: Unknown recipe mysql!\n", run.err);
                     require(provider.calls.empty(), "provider untouched");
                   }});

  tests.push_back({"cli_provision_password_length_from_config", [] {
                     lxcforge::testing::FakeSandboxProvider provider;
                     auto config = lxcforge::testing::mock_config();
                     config.credentials.password_length = 20;
                     const auto run = provision(
                         cli::ProvisionRequest{.recipe = "django", .prefix = std::string("acme")},
                         provider, config);
                     require(run.code == 0, run.err);
                     const auto key = run.out.find("\"user_password\": \"");
                     require(key != std::string::npos, "password field");
                     const auto start = key + std::string("\"user_password\": \"").size();
                     const auto end = run.out.find('"', start);
                     require(end - start == 20, "configured password length");
                   }});

  tests.push_back({"cli_version_and_help", [] {
                     require(run_cli({"lxcforge", "version"}) == 0, "version");
                     require(run_cli({"lxcforge", "help"}) == 0, "help");
                     require(run_cli({"lxcforge", "recipes"}) == 0, "recipes");
                   }});

  tests.push_back({"cli_unknown_command_and_bad_options", [] {
                     require(run_cli({"lxcforge"}) == 1, "no recipe");
                     require(run_cli({"lxcforge", "mysql"}) == 1, "unknown recipe");
                     require(run_cli({"lxcforge", "--config"}) == 1, "missing config value");
                     lxcforge::config::clear_config_path_override();
                   }});
}
