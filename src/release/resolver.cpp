#include "lxcforge/release/resolver.hpp"

#include "lxcforge/common/fs.hpp"
#include "lxcforge/observability/global.hpp"

#include <algorithm>

namespace lxcforge::release {

namespace {

constexpr std::size_t CODENAME_LINE = 4;

bool plausible_codename(const std::string &value) {
  return !value.empty() && std::all_of(value.begin(), value.end(), [](const char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-';
  });
}

bool is_quote(const char ch) { return ch == '\'' || ch == '"'; }

std::string strip_quotes(std::string value) {
  while (!value.empty() && is_quote(value.front())) {
    value.erase(value.begin());
  }
  while (!value.empty() && is_quote(value.back())) {
    value.pop_back();
  }
  return value;
}

} // namespace

DebianReleaseResolver::DebianReleaseResolver(std::shared_ptr<net::HttpClient> http,
                                             std::string metadata_url,
                                             const std::uint64_t timeout_ms)
    : http_(std::move(http)), metadata_url_(std::move(metadata_url)), timeout_ms_(timeout_ms) {}

std::optional<std::string> DebianReleaseResolver::resolve() {
  if (!http_ || metadata_url_.empty()) {
    return std::nullopt;
  }

  const auto response = http_->get(metadata_url_, timeout_ms_);
  if (!response.error.empty()) {
    observability::record_error("release", "metadata fetch failed: " + response.error);
    return std::nullopt;
  }
  if (response.status != 200) {
    observability::record_error("release",
                                "metadata fetch returned HTTP " + std::to_string(response.status));
    return std::nullopt;
  }

  auto codename = parse_release_codename(response.body);
  if (!codename.has_value()) {
    observability::record_error("release", "metadata response is malformed");
  }
  return codename;
}

std::optional<std::string> parse_release_codename(const std::string &body) {
  const auto lines = common::split_lines(body);
  if (lines.size() <= CODENAME_LINE) {
    return std::nullopt;
  }

  const auto tokens = common::split_whitespace(lines[CODENAME_LINE]);
  if (tokens.size() < 2) {
    return std::nullopt;
  }

  std::string codename = strip_quotes(tokens[1]);
  if (!plausible_codename(codename)) {
    return std::nullopt;
  }
  return codename;
}

std::string resolve_or(ReleaseResolver &resolver, const std::string &fallback) {
  if (auto resolved = resolver.resolve(); resolved.has_value() && !resolved->empty()) {
    return *resolved;
  }
  return fallback;
}

} // namespace lxcforge::release
