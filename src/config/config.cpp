#include "lxcforge/config/config.hpp"

#include "lxcforge/common/fs.hpp"
#include "lxcforge/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace lxcforge::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".lxcforge";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("LXCFORGE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> non_empty_env(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

void load_release_config(ReleaseConfig &release, const common::TomlDocument &doc) {
  release.metadata_url = doc.get_string("release.metadata_url", release.metadata_url);
  release.fallback = common::trim(doc.get_string("release.fallback", release.fallback));
  if (doc.has("release.pinned")) {
    const std::string pinned = common::trim(doc.get_string("release.pinned"));
    if (!pinned.empty()) {
      release.pinned = pinned;
    }
  }
  release.timeout_ms = doc.get_u64("release.timeout_ms", release.timeout_ms);
}

void load_lxc_config(LxcConfig &lxc, const common::TomlDocument &doc) {
  if (doc.has("lxc.lxc_path")) {
    lxc.lxc_path = common::expand_path(doc.get_string("lxc.lxc_path"));
  }
  lxc.template_name = doc.get_string("lxc.template", lxc.template_name);
  lxc.dist = doc.get_string("lxc.dist", lxc.dist);
  lxc.arch = doc.get_string("lxc.arch", lxc.arch);
  lxc.address_timeout_secs = doc.get_u64("lxc.address_timeout_secs", lxc.address_timeout_secs);
  lxc.poll_interval_ms = doc.get_u64("lxc.poll_interval_ms", lxc.poll_interval_ms);
  lxc.command_timeout_secs = doc.get_u64("lxc.command_timeout_secs", lxc.command_timeout_secs);
}

} // namespace

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  if (auto prefix = non_empty_env("LXCFORGE_PREFIX"); prefix.has_value()) {
    config.default_prefix = *prefix;
  }
  if (auto release = non_empty_env("LXCFORGE_RELEASE"); release.has_value()) {
    config.release.pinned = *release;
  }
  if (auto lxc_path = non_empty_env("LXCFORGE_LXC_PATH"); lxc_path.has_value()) {
    config.lxc.lxc_path = common::expand_path(*lxc_path);
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;
  config.default_prefix = common::trim(doc.get_string("default_prefix", config.default_prefix));
  load_release_config(config.release, doc);
  load_lxc_config(config.lxc, doc);
  config.credentials.password_length = static_cast<std::size_t>(
      doc.get_u64("credentials.password_length", config.credentials.password_length));
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  // No file to read (no HOME, or nothing at the path) means built-in defaults.
  const auto cfg_path_result = config_path();
  std::error_code ec;
  const bool present =
      cfg_path_result.ok() && std::filesystem::exists(cfg_path_result.value(), ec);
  if (ec) {
    return common::Result<Config>::failure(cfg_path_result.value().string() + ": " +
                                           ec.message());
  }
  if (!present) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }
  const auto &path = cfg_path_result.value();

  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content.error());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> problems;
  if (config.default_prefix.empty()) {
    problems.emplace_back("default_prefix must not be empty");
  }
  if (config.release.fallback.empty()) {
    problems.emplace_back("release.fallback must not be empty");
  }
  if (config.release.metadata_url.empty() && !config.release.pinned.has_value()) {
    problems.emplace_back("release.metadata_url must be set unless release.pinned is");
  }
  if (config.lxc.address_timeout_secs == 0) {
    problems.emplace_back("lxc.address_timeout_secs must be greater than zero");
  }
  if (config.lxc.command_timeout_secs == 0) {
    problems.emplace_back("lxc.command_timeout_secs must be greater than zero");
  }
  if (config.lxc.poll_interval_ms == 0) {
    problems.emplace_back("lxc.poll_interval_ms must be greater than zero");
  }
  if (config.credentials.password_length == 0) {
    problems.emplace_back("credentials.password_length must be greater than zero");
  }
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty() && backend != "none" && backend != "noop" && backend != "log") {
    problems.emplace_back("observability.backend must be one of none, noop, log");
  }
  return problems;
}

} // namespace lxcforge::config
