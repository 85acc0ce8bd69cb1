#pragma once

#include <chrono>
#include <string>

namespace cic::lookup {

struct HttpResponse {
  bool        ok     = false; // transport succeeded and status is 2xx
  long        status = 0;
  std::string body;
  std::string error;
};

// Blocking GET through libcurl. Never throws; failures land in `error`.
HttpResponse HttpGet(const std::string& url, std::chrono::milliseconds timeout);

} // namespace cic::lookup
