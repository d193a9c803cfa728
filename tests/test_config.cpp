#include "test_framework.hpp"

#include "lxcforge/common/fs.hpp"
#include "lxcforge/config/config.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = lxcforge::config::config_path_override();
    if (next.has_value()) {
      lxcforge::config::set_config_path_override(*next);
    } else {
      lxcforge::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      lxcforge::config::set_config_path_override(*old_override);
    } else {
      lxcforge::config::clear_config_path_override();
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("lxcforge-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

bool mentions(const std::vector<std::string> &problems, const std::string &needle) {
  return std::any_of(problems.begin(), problems.end(), [&](const std::string &problem) {
    return problem.find(needle) != std::string::npos;
  });
}

} // namespace

void register_config_tests(std::vector<lxcforge::tests::TestCase> &tests) {
  using lxcforge::tests::require;
  namespace cfg = lxcforge::config;

  tests.push_back({"config_path_lives_under_home", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("LXCFORGE_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / ".lxcforge" / "config.toml",
                             "unexpected config path " + path.value().string());
                     require(!std::filesystem::exists(home / ".lxcforge"),
                             "resolving the path creates nothing");
                   }});

  tests.push_back({"load_config_with_unusable_home_returns_defaults", [] {
                     // HOME below a regular file can be neither read nor created.
                     const auto root = make_temp_home();
                     write_file(root / "not-a-dir", "");
                     const auto home = root / "not-a-dir" / "home";
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("LXCFORGE_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_prefix("LXCFORGE_PREFIX", std::nullopt);
                     const EnvGuard env_release("LXCFORGE_RELEASE", "bookworm");
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().default_prefix == "test", "defaults used");
                     require(loaded.value().release.pinned ==
                                 std::optional<std::string>("bookworm"),
                             "env overrides still apply");
                     require(std::filesystem::is_regular_file(root / "not-a-dir"),
                             "nothing created under HOME");
                   }});

  tests.push_back({"load_config_without_home_returns_defaults", [] {
                     const EnvGuard env_home("HOME", std::nullopt);
                     const EnvGuard env_path("LXCFORGE_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_prefix("LXCFORGE_PREFIX", std::nullopt);
                     const ConfigOverrideGuard cfg_override;
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().default_prefix == "test", "defaults used");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("LXCFORGE_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_prefix("LXCFORGE_PREFIX", std::nullopt);
                     const EnvGuard env_release("LXCFORGE_RELEASE", std::nullopt);
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.default_prefix == "test", "default prefix should be test");
                     require(config.release.fallback == "jessie", "fallback release");
                     require(!config.release.pinned.has_value(), "nothing pinned by default");
                     require(config.lxc.template_name == "download", "template");
                     require(config.lxc.address_timeout_secs == 120, "address timeout");
                     require(config.credentials.password_length == 8, "password length");
                     require(cfg::validate_config(config).empty(), "defaults are valid");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_prefix("LXCFORGE_PREFIX", std::nullopt);
                     const EnvGuard env_release("LXCFORGE_RELEASE", std::nullopt);
                     const EnvGuard env_lxc("LXCFORGE_LXC_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override(home / "custom.toml");

                     write_file(home / "custom.toml", R"(
default_prefix = "acme"

[release]
fallback = "bullseye"
pinned = "bookworm"
timeout_ms = 2500

[lxc]
lxc_path = "/srv/lxc"
arch = "arm64"
address_timeout_secs = 30
poll_interval_ms = 250

[credentials]
password_length = 16

[observability]
backend = "log"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.default_prefix == "acme", "prefix");
                     require(config.release.fallback == "bullseye", "fallback");
                     require(config.release.pinned == std::optional<std::string>("bookworm"),
                             "pinned release");
                     require(config.release.timeout_ms == 2500, "timeout");
                     require(config.lxc.lxc_path == "/srv/lxc", "lxc path");
                     require(config.lxc.arch == "arm64", "arch");
                     require(config.lxc.dist == "debian", "dist keeps its default");
                     require(config.lxc.address_timeout_secs == 30, "address timeout");
                     require(config.lxc.poll_interval_ms == 250, "poll interval");
                     require(config.credentials.password_length == 16, "password length");
                     require(config.observability.backend == "log", "backend");
                   }});

  tests.push_back({"config_path_env_override", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;
                     const EnvGuard env_path("LXCFORGE_CONFIG_PATH",
                                             (home / "elsewhere.toml").string());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / "elsewhere.toml", "env path wins");
                   }});

  tests.push_back({"env_overrides_apply_after_file", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override(home / "config.toml");
                     write_file(home / "config.toml", "default_prefix = \"file\"\n");
                     const EnvGuard env_prefix("LXCFORGE_PREFIX", "envprefix");
                     const EnvGuard env_release("LXCFORGE_RELEASE", "trixie");
                     const EnvGuard env_lxc("LXCFORGE_LXC_PATH", "/opt/lxc");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().default_prefix == "envprefix", "env prefix");
                     require(loaded.value().release.pinned ==
                                 std::optional<std::string>("trixie"),
                             "env release pins");
                     require(loaded.value().lxc.lxc_path == "/opt/lxc", "env lxc path");
                   }});

  tests.push_back({"load_config_reports_parse_errors_with_path", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override(home / "broken.toml");
                     write_file(home / "broken.toml", "default_prefix\n");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "parse error expected");
                     require(loaded.error().find("broken.toml") != std::string::npos,
                             "error names the file: " + loaded.error());
                   }});

  tests.push_back({"validate_config_rejects_unusable_values", [] {
                     cfg::Config config;
                     config.release.fallback = "";
                     config.lxc.address_timeout_secs = 0;
                     config.lxc.command_timeout_secs = 0;
                     config.credentials.password_length = 0;
                     config.observability.backend = "prometheus";
                     const auto problems = cfg::validate_config(config);
                     require(mentions(problems, "release.fallback"), "empty fallback");
                     require(mentions(problems, "address_timeout_secs"), "zero timeout");
                     require(mentions(problems, "command_timeout_secs"),
                             "zero command timeout");
                     require(mentions(problems, "password_length"), "zero password length");
                     require(mentions(problems, "observability.backend"), "unknown backend");
                   }});
}
