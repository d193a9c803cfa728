#pragma once

#include "lxcforge/common/result.hpp"
#include "lxcforge/config/schema.hpp"
#include "lxcforge/release/resolver.hpp"
#include "lxcforge/sandbox/provider.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace lxcforge::cli {

struct ProvisionRequest {
  std::string recipe;
  // Falls back to the configured default prefix when absent.
  std::optional<std::string> prefix;
  bool verbose = false;
  bool debug = false;
};

/// Parses `[-v|--verbose] [-d|--debug] [prefix]` following the recipe name.
[[nodiscard]] common::Result<ProvisionRequest>
parse_provision_args(const std::string &recipe, std::vector<std::string> args);

/// Runs one recipe end to end. Prints the result JSON to `out` and returns 0, or prints
/// `Error: <message>!` to `err` and returns 1.
int run_provision(const ProvisionRequest &request, const config::Config &config,
                  sandbox::SandboxProvider &provider, release::ReleaseResolver &resolver,
                  const std::string &host_name, std::ostream &out, std::ostream &err);

int run_cli(int argc, char **argv);

} // namespace lxcforge::cli
