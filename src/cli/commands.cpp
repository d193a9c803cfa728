#include "lxcforge/cli/commands.hpp"

#include "lxcforge/common/fs.hpp"
#include "lxcforge/common/interrupt.hpp"
#include "lxcforge/config/config.hpp"
#include "lxcforge/net/http.hpp"
#include "lxcforge/observability/factory.hpp"
#include "lxcforge/observability/global.hpp"
#include "lxcforge/provision/provisioner.hpp"
#include "lxcforge/recipes/registry.hpp"
#include "lxcforge/sandbox/lxc.hpp"
#include "lxcforge/security/password.hpp"

#include <array>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace lxcforge::cli {

namespace {

std::string version_string() {
#ifdef LXCFORGE_VERSION
  std::string version = LXCFORGE_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef LXCFORGE_GIT_COMMIT
  const std::string commit = LXCFORGE_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "lxcforge " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_flag(std::vector<std::string> &args, const std::string &long_name,
               const std::string &short_name) {
  bool found = false;
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == long_name || args[i] == short_name) {
      args.erase(args.begin() + static_cast<long>(i));
      found = true;
      continue;
    }
    ++i;
  }
  return found;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

void print_help() {
  std::cout << "lxcforge - provision LXC containers from fixed recipes\n\n";
  std::cout << "Usage:\n";
  std::cout << "  lxcforge [--config PATH] <recipe> [-v|--verbose] [-d|--debug] [prefix]\n";
  std::cout << "  lxcforge recipes\n";
  std::cout << "  lxcforge help\n";
  std::cout << "  lxcforge version\n\n";
  std::cout << "Options:\n";
  std::cout << "  -v, --verbose   print each step before it runs\n";
  std::cout << "  -d, --debug     show the output of commands run in the container\n";
  std::cout << "  prefix          container name prefix, giving <prefix>_<recipe>_<release>\n\n";
  std::cout << "Recipes:\n";
  for (const auto &recipe : recipes::list_recipes()) {
    std::cout << "  " << recipe.name << "  " << recipe.summary << "\n";
  }
}

int print_error(std::ostream &err, const std::string &message) {
  err << "Error: " << message << "!\n";
  return 1;
}

std::string local_host_name() {
  std::array<char, 256> buffer{};
  if (gethostname(buffer.data(), buffer.size() - 1) != 0) {
    return "localhost";
  }
  return std::string(buffer.data());
}

int run_recipe(const std::string &recipe, std::vector<std::string> args) {
  auto request = parse_provision_args(recipe, std::move(args));
  if (!request.ok()) {
    return print_error(std::cerr, request.error());
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return print_error(std::cerr, cfg.error());
  }
  const auto problems = config::validate_config(cfg.value());
  if (!problems.empty()) {
    return print_error(std::cerr, "invalid config: " + problems.front());
  }
  const config::Config &config = cfg.value();

  sandbox::LxcProvider provider(sandbox::LxcProviderOptions{
      .lxc_path = config.lxc.lxc_path,
      .poll_interval = std::chrono::milliseconds(config.lxc.poll_interval_ms),
      .command_timeout = std::chrono::seconds(config.lxc.command_timeout_secs),
  });

  std::unique_ptr<release::ReleaseResolver> resolver;
  if (config.release.pinned.has_value()) {
    resolver = std::make_unique<release::FixedReleaseResolver>(*config.release.pinned);
  } else {
    resolver = std::make_unique<release::DebianReleaseResolver>(
        std::make_shared<net::CurlHttpClient>(), config.release.metadata_url,
        config.release.timeout_ms);
  }

  // Ctrl-C must unwind through the rollback guard rather than kill the process.
  const common::InterruptGuard interrupts;
  return run_provision(request.value(), config, provider, *resolver, local_host_name(), std::cout,
                       std::cerr);
}

} // namespace

common::Result<ProvisionRequest> parse_provision_args(const std::string &recipe,
                                                      std::vector<std::string> args) {
  ProvisionRequest request;
  request.recipe = recipe;
  request.verbose = take_flag(args, "--verbose", "-v");
  request.debug = take_flag(args, "--debug", "-d");

  for (const auto &arg : args) {
    if (common::starts_with(arg, "-")) {
      return common::Result<ProvisionRequest>::failure("unknown option " + arg);
    }
  }
  if (args.size() > 1) {
    return common::Result<ProvisionRequest>::failure("unexpected argument " + args[1]);
  }
  if (!args.empty()) {
    request.prefix = args.front();
  }
  return common::Result<ProvisionRequest>::success(std::move(request));
}

int run_provision(const ProvisionRequest &request, const config::Config &config,
                  sandbox::SandboxProvider &provider, release::ReleaseResolver &resolver,
                  const std::string &host_name, std::ostream &out, std::ostream &err) {
  observability::set_global_observer(observability::create_observer(config, request.verbose));

  auto password = security::generate_password(config.credentials.password_length);
  if (!password.ok()) {
    return print_error(err, password.error());
  }
  const auto recipe = recipes::make_recipe(request.recipe, password.value());
  if (recipe == nullptr) {
    return print_error(err, "Unknown recipe " + request.recipe);
  }

  provision::Provisioner provisioner(
      provider, resolver,
      provision::ProvisionOptions{
          .prefix = request.prefix.value_or(config.default_prefix),
          .fallback_release = config.release.fallback,
          .host_name = host_name,
          .distro = sandbox::DistroParams{.template_name = config.lxc.template_name,
                                          .dist = config.lxc.dist,
                                          .release = "",
                                          .arch = config.lxc.arch},
          .address_timeout = std::chrono::seconds(config.lxc.address_timeout_secs),
          .debug = request.debug,
      });

  auto result = provisioner.run(*recipe);
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  if (!result.ok()) {
    return print_error(err, result.error());
  }

  if (request.verbose) {
    out << "Success!\n";
  }
  out << result.value().to_json() << "\n";
  return 0;
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    return print_error(std::cerr, global_error);
  }

  if (args.empty()) {
    print_help();
    return 1;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "recipes") {
    for (const auto &recipe : recipes::list_recipes()) {
      std::cout << recipe.name << "\t" << recipe.summary << "\n";
    }
    return 0;
  }
  if (recipes::is_known_recipe(subcommand)) {
    try {
      return run_recipe(subcommand, std::move(args));
    } catch (const std::exception &ex) {
      return print_error(std::cerr, ex.what());
    }
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace lxcforge::cli
