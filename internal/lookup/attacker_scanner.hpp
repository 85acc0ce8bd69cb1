#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/metrics_repository.hpp"
#include "internal/util/time.hpp"

namespace cic::lookup {

struct ScanInfo {
  std::string open_ports; // "22,80,443"
  std::string os_guess;
};

/*
  Port scan of a remote address with a persistent TTL cache (attacker_scans).

  A completed scan with no open ports is a valid result and is stored; a
  scan that fails or times out returns an empty ScanInfo and is not.
*/
class AttackerScanner {
 public:
  using Fetcher = std::function<std::optional<ScanInfo>(const std::string& ip)>;

  AttackerScanner(std::shared_ptr<db::MetricsRepository> repository, std::chrono::seconds ttl, Fetcher fetcher);

  ScanInfo Scan(const std::string& ip, util::TimePoint now);

  // `nmap -sT --top-ports 20 <ip>`
  static Fetcher CommandFetcher(std::chrono::milliseconds timeout);

  // Open ports joined by commas; OS from "OS details:"/"Running:" (30 chars)
  // or "Linux" when 22 is open.
  static ScanInfo ParseNmap(const std::string& out);

 private:
  std::shared_ptr<db::MetricsRepository> repository_;
  std::chrono::seconds                   ttl_;
  Fetcher                                fetcher_;
};

} // namespace cic::lookup
