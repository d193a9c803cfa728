#pragma once

#include <cstdint>
#include <string>

namespace lxcforge::net {

struct HttpResponse {
  // 0 when no response arrived.
  std::uint16_t status = 0;
  std::string body;
  // Transport failure (DNS, connect, timeout); empty when a response arrived.
  std::string error;
};

/// Plain GET over HTTP(S). Transport failures are reported in the response, not thrown.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse get(const std::string &url, std::uint64_t timeout_ms) override;
};

} // namespace lxcforge::net
