#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/metrics_repository.hpp"
#include "internal/util/time.hpp"

namespace cic::lookup {

inline constexpr const char* kUnknownHostname = "unknown";

/*
  Reverse DNS with a persistent TTL cache (dns_cache).

  A stored row younger than the TTL is returned without a lookup. Failed
  lookups return "unknown" and are not stored, so the next call retries.
*/
class DnsResolver {
 public:
  // Hostname for `ip`, or nullopt on failure.
  using Fetcher = std::function<std::optional<std::string>(const std::string& ip)>;

  DnsResolver(std::shared_ptr<db::MetricsRepository> repository, std::chrono::seconds ttl, Fetcher fetcher);

  std::string Resolve(const std::string& ip, util::TimePoint now);

  // `dig -x <ip> +short`, then `host <ip>`.
  static Fetcher CommandFetcher(std::chrono::milliseconds timeout);

  // First answer of `dig +short`, trailing dot removed.
  static std::optional<std::string> ParseDig(const std::string& out);

  // "... domain name pointer host.example.com."
  static std::optional<std::string> ParseHost(const std::string& out);

 private:
  std::shared_ptr<db::MetricsRepository> repository_;
  std::chrono::seconds                   ttl_;
  Fetcher                                fetcher_;
};

} // namespace cic::lookup
