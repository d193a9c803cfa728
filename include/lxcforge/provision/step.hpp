#pragma once

#include "lxcforge/common/result.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lxcforge::provision {

enum class StepMode {
  Direct,
  // host_command runs on the host and its stdout feeds command's stdin.
  Piped,
};

struct Step {
  std::string description;
  std::vector<std::string> command;
  StepMode mode = StepMode::Direct;
  std::vector<std::string> host_command;
  bool debug = false;

  [[nodiscard]] static Step direct(std::string description, std::vector<std::string> command,
                                   bool debug = false);
  [[nodiscard]] static Step piped(std::string description, std::vector<std::string> host_command,
                                  std::vector<std::string> command, bool debug = false);
};

struct ExecutionOutcome {
  int exit_status = 0;
  std::string description;

  [[nodiscard]] bool ok() const { return exit_status == 0; }
};

enum class ConfigOp { Clear, Append, Set };

struct ConfigEdit {
  ConfigOp op = ConfigOp::Append;
  std::string key;
  std::string value;
};

/// A described group of sandbox configuration edits applied before first start.
struct ConfigMutation {
  std::string description;
  std::vector<ConfigEdit> edits;
};

/// Work done on the host rather than inside the sandbox.
struct HostAction {
  std::string description;
  std::function<common::Status()> run;
};

struct ProvisioningResult {
  std::map<std::string, std::string> fields;

  /// Sorted, 4-space indented JSON object.
  [[nodiscard]] std::string to_json() const;
};

} // namespace lxcforge::provision
