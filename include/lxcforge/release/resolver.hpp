#pragma once

#include "lxcforge/net/http.hpp"

#include <memory>
#include <optional>
#include <string>

namespace lxcforge::release {

/// Source of the OS release codename used to build sandboxes.
class ReleaseResolver {
public:
  virtual ~ReleaseResolver() = default;

  /// Best effort; returns nullopt instead of failing.
  [[nodiscard]] virtual std::optional<std::string> resolve() = 0;
};

/// Reads the codename of the current Debian stable release from the archive's
/// `dists/stable/Release` file.
class DebianReleaseResolver final : public ReleaseResolver {
public:
  DebianReleaseResolver(std::shared_ptr<net::HttpClient> http, std::string metadata_url,
                        std::uint64_t timeout_ms = 10'000);

  [[nodiscard]] std::optional<std::string> resolve() override;

private:
  std::shared_ptr<net::HttpClient> http_;
  std::string metadata_url_;
  std::uint64_t timeout_ms_;
};

/// Always answers with the same codename (release pinned by configuration).
class FixedReleaseResolver final : public ReleaseResolver {
public:
  explicit FixedReleaseResolver(std::string codename) : codename_(std::move(codename)) {}

  [[nodiscard]] std::optional<std::string> resolve() override { return codename_; }

private:
  std::string codename_;
};

/// Extracts the codename from the body of a Debian `Release` file: the second token of the
/// fifth line, stripped of quote characters.
[[nodiscard]] std::optional<std::string> parse_release_codename(const std::string &body);

/// resolve() or, when that yields nothing, `fallback`.
[[nodiscard]] std::string resolve_or(ReleaseResolver &resolver, const std::string &fallback);

} // namespace lxcforge::release
