#include "test_framework.hpp"

#include "lxcforge/release/resolver.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

constexpr const char *RELEASE_BODY = "Origin: Debian\n"
                                     "Label: Debian\n"
                                     "Suite: stable\n"
                                     "Version: 12.5\n"
                                     "Codename: bookworm\n"
                                     "Changelogs: https://metadata.ftp-master.debian.org/\n";

std::shared_ptr<lxcforge::testing::FakeHttpClient> http_returning(std::uint16_t status,
                                                                  std::string body) {
  auto http = std::make_shared<lxcforge::testing::FakeHttpClient>();
  http->response.status = status;
  http->response.body = std::move(body);
  return http;
}

} // namespace

void register_release_tests(std::vector<lxcforge::tests::TestCase> &tests) {
  using lxcforge::tests::require;
  namespace rel = lxcforge::release;

  tests.push_back({"release_parse_fifth_line", [] {
                     const auto codename = rel::parse_release_codename(RELEASE_BODY);
                     require(codename == std::optional<std::string>("bookworm"),
                             "expected bookworm");
                   }});

  tests.push_back({"release_parse_strips_quotes", [] {
                     const auto codename =
                         rel::parse_release_codename("a\nb\nc\nd\nCodename: 'trixie'\n");
                     require(codename == std::optional<std::string>("trixie"), "quotes stripped");
                   }});

  tests.push_back({"release_parse_rejects_short_or_odd_bodies", [] {
                     require(!rel::parse_release_codename("").has_value(), "empty body");
                     require(!rel::parse_release_codename("a\nb\nc\nd\n").has_value(),
                             "four lines only");
                     require(!rel::parse_release_codename("a\nb\nc\nd\nCodename:\n").has_value(),
                             "no second token");
                     require(!rel::parse_release_codename("a\nb\nc\nd\nX: <html>\n").has_value(),
                             "implausible codename");
                   }});

  tests.push_back({"release_resolver_fetches_configured_url", [] {
                     auto http = http_returning(200, RELEASE_BODY);
                     rel::DebianReleaseResolver resolver(http, "http://mirror/Release", 1234);
                     const auto codename = resolver.resolve();
                     require(codename == std::optional<std::string>("bookworm"), "bookworm");
                     require(http->requested_urls.size() == 1, "exactly one request");
                     require(http->requested_urls.front() == "http://mirror/Release", "url");
                     require(http->last_timeout_ms == 1234, "timeout forwarded");
                   }});

  tests.push_back({"release_resolver_absent_on_failures", [] {
                     auto not_found = http_returning(404, RELEASE_BODY);
                     rel::DebianReleaseResolver missing(not_found, "http://mirror/Release");
                     require(!missing.resolve().has_value(), "non-200 gives absent");

                     auto offline = http_returning(0, "");
                     offline->response.error = "could not resolve host";
                     rel::DebianReleaseResolver unreachable(offline, "http://mirror/Release");
                     require(!unreachable.resolve().has_value(), "network error gives absent");

                     auto garbage = http_returning(200, "<html>maintenance</html>");
                     rel::DebianReleaseResolver malformed(garbage, "http://mirror/Release");
                     require(!malformed.resolve().has_value(), "malformed body gives absent");
                   }});

  tests.push_back({"release_resolve_or_uses_fallback", [] {
                     lxcforge::testing::CountingResolver absent(std::nullopt);
                     require(rel::resolve_or(absent, "jessie") == "jessie", "fallback used");
                     require(absent.calls == 1, "resolved once, no retries");

                     rel::FixedReleaseResolver pinned("bookworm");
                     require(rel::resolve_or(pinned, "jessie") == "bookworm", "pinned wins");
                   }});
}
