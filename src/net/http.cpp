#include "lxcforge/net/http.hpp"

#include <curl/curl.h>
#include <memory>

namespace lxcforge::net {

namespace {

constexpr long MAX_REDIRECTS = 5;

size_t append_body(char *data, size_t size, size_t count, void *target) {
  static_cast<std::string *>(target)->append(data, size * count);
  return size * count;
}

struct CurlHandleDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::get(const std::string &url, const std::uint64_t timeout_ms) {
  HttpResponse response;

  std::unique_ptr<CURL, CurlHandleDeleter> handle(curl_easy_init());
  if (!handle) {
    response.error = "curl_easy_init failed";
    return response;
  }
  CURL *curl = handle.get();

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, MAX_REDIRECTS);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "lxcforge/0.1");

  if (const CURLcode code = curl_easy_perform(curl); code != CURLE_OK) {
    response.error = curl_easy_strerror(code);
    return response;
  }

  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  return response;
}

} // namespace lxcforge::net
