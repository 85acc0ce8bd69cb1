#include "http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace cic::lookup {

namespace {

constexpr const char* kUserAgent = "cic-collector/1.0";

struct CurlDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

size_t WriteBody(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

void EnsureGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

HttpResponse HttpGet(const std::string& url, std::chrono::milliseconds timeout) {
  EnsureGlobalInit();

  HttpResponse response;

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    response.error = "failed to initialize curl";
    return response;
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  const CURLcode res = curl_easy_perform(curl.get());
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

  if (res != CURLE_OK) {
    response.error = curl_easy_strerror(res);
    return response;
  }

  response.ok = response.status >= 200 && response.status < 300;
  if (!response.ok) response.error = "HTTP " + std::to_string(response.status);
  return response;
}

} // namespace cic::lookup
