#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/metrics_repository.hpp"
#include "internal/util/time.hpp"
#include "rate_limiter.hpp"

namespace cic::lookup {

struct GeoInfo {
  std::string country_code = "?";
  std::string city;
  std::string isp;
};

/*
  IP geolocation with a persistent TTL cache (geo_cache).

  Every outbound request first takes a slot from the shared RateLimiter.
  Failures return the "?" sentinel and are not stored.
*/
class GeoLocator {
 public:
  using Fetcher = std::function<std::optional<GeoInfo>(const std::string& ip)>;

  GeoLocator(std::shared_ptr<db::MetricsRepository> repository,
             std::shared_ptr<RateLimiter>           limiter,
             std::chrono::seconds                   ttl,
             Fetcher                                fetcher);

  GeoInfo Locate(const std::string& ip, util::TimePoint now);

  // GET <endpoint><ip>?fields=status,country,countryCode,city,isp
  static Fetcher HttpFetcher(std::string endpoint, std::chrono::milliseconds timeout);

  // nullopt for unparseable bodies and "status":"fail" answers.
  static std::optional<GeoInfo> ParseResponse(const std::string& body);

 private:
  std::shared_ptr<db::MetricsRepository> repository_;
  std::shared_ptr<RateLimiter>           limiter_;
  std::chrono::seconds                   ttl_;
  Fetcher                                fetcher_;
};

} // namespace cic::lookup
