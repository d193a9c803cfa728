#pragma once

#include "lxcforge/common/result.hpp"
#include "lxcforge/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace lxcforge::config {

/// Where the config file is read from. Nothing is created; the file may not exist.
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Defaults plus environment overrides when there is no config file.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Returns the list of problems found; an empty list means the config is usable.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace lxcforge::config
