#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lxcforge::config {

struct ReleaseConfig {
  std::string metadata_url = "http://ftp.debian.org/debian/dists/stable/Release";
  // Used when the metadata endpoint cannot be reached or parsed.
  std::string fallback = "jessie";
  // Skips resolution entirely when set.
  std::optional<std::string> pinned;
  std::uint64_t timeout_ms = 10'000;
};

struct LxcConfig {
  // Empty means "ask lxc-config".
  std::string lxc_path;
  std::string template_name = "download";
  std::string dist = "debian";
  std::string arch = "amd64";
  std::uint64_t address_timeout_secs = 120;
  std::uint64_t poll_interval_ms = 1'000;
  std::uint64_t command_timeout_secs = 1'800;
};

struct CredentialsConfig {
  std::size_t password_length = 8;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  std::string default_prefix = "test";
  ReleaseConfig release;
  LxcConfig lxc;
  CredentialsConfig credentials;
  ObservabilityConfig observability;
};

} // namespace lxcforge::config
