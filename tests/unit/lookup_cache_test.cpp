#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_metrics_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/lookup/attacker_scanner.hpp"
#include "internal/lookup/dns_resolver.hpp"
#include "internal/lookup/geo_locator.hpp"
#include "internal/lookup/ip_address.hpp"
#include "internal/lookup/rate_limiter.hpp"

namespace {

using namespace std::chrono_literals;

using cic::lookup::AttackerScanner;
using cic::lookup::DnsResolver;
using cic::lookup::GeoInfo;
using cic::lookup::GeoLocator;
using cic::lookup::RateLimiter;
using cic::lookup::ScanInfo;

std::shared_ptr<cic::db::MetricsRepository> OpenRepository(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "cic_lookup_cache_tests";
  std::filesystem::create_directories(dir);

  const auto path = dir / (test_name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(path.string() + suffix);

  auto db = std::make_shared<cic::db::sqlite::SqliteDB>(path.string());
  cic::db::sqlite::BootstrapSchema(*db);
  return std::make_shared<cic::db::sqlite::SqliteMetricsRepository>(db);
}

void TestIpLiteralValidation() {
  assert(cic::lookup::IsIpLiteral("203.0.113.9"));
  assert(cic::lookup::IsIpLiteral("2001:db8::1"));
  assert(!cic::lookup::IsIpLiteral("example.com"));
  assert(!cic::lookup::IsIpLiteral("1.2.3.4; rm -rf /"));
  assert(!cic::lookup::IsIpLiteral(""));
}

void TestDnsHitMissAndExpiry() {
  auto repo  = OpenRepository("dns_ttl");
  int  calls = 0;

  DnsResolver dns(repo, 24h, [&](const std::string&) -> std::optional<std::string> {
    ++calls;
    return std::string("host.example");
  });

  const auto t0 = cic::util::Now();
  assert(dns.Resolve("203.0.113.9", t0) == "host.example");
  assert(calls == 1);

  assert(dns.Resolve("203.0.113.9", t0 + 1h) == "host.example");
  assert(calls == 1);

  assert(dns.Resolve("203.0.113.9", t0 + 25h) == "host.example");
  assert(calls == 2);
}

void TestDnsFailuresAreNotCached() {
  auto repo  = OpenRepository("dns_failure");
  int  calls = 0;

  DnsResolver dns(repo, 24h, [&](const std::string&) -> std::optional<std::string> {
    ++calls;
    return std::nullopt;
  });

  const auto now = cic::util::Now();
  assert(dns.Resolve("198.51.100.7", now) == cic::lookup::kUnknownHostname);
  assert(dns.Resolve("198.51.100.7", now) == cic::lookup::kUnknownHostname);
  assert(calls == 2);

  auto tx = repo->BeginRead();
  assert(!repo->GetDns(*tx, "198.51.100.7").has_value());
  tx->Commit();

  // not an IP: rejected before any lookup
  assert(dns.Resolve("$(reboot)", now) == cic::lookup::kUnknownHostname);
  assert(calls == 2);
}

void TestDnsOutputParsing() {
  assert(DnsResolver::ParseDig("host.example.\n") == std::string("host.example"));
  assert(!DnsResolver::ParseDig("").has_value());
  assert(!DnsResolver::ParseDig(";; connection timed out; no servers could be reached\n").has_value());
  assert(DnsResolver::ParseHost("9.113.0.203.in-addr.arpa domain name pointer host.example.\n") == std::string("host.example"));
  assert(!DnsResolver::ParseHost("Host 9.113.0.203.in-addr.arpa. not found: 3(NXDOMAIN)\n").has_value());
}

void TestGeoCachesAndRateLimits() {
  auto repo    = OpenRepository("geo");
  auto limiter = std::make_shared<RateLimiter>(100ms);
  int  calls   = 0;

  GeoLocator geo(repo, limiter, 7 * 24h, [&](const std::string& ip) -> std::optional<GeoInfo> {
    ++calls;
    if (ip == "192.0.2.1") return std::nullopt;
    return GeoInfo{"NL", "Amsterdam", "Example ISP"};
  });

  const auto now   = cic::util::Now();
  const auto start = std::chrono::steady_clock::now();

  assert(geo.Locate("203.0.113.9", now).country_code == "NL");
  assert(geo.Locate("198.51.100.7", now).city == "Amsterdam");
  assert(geo.Locate("192.0.2.1", now).country_code == "?");

  // three outbound requests need at least two full intervals
  assert(std::chrono::steady_clock::now() - start >= 200ms);
  assert(calls == 3);

  // hit: no request, no limiter slot
  assert(geo.Locate("203.0.113.9", now + 1h).isp == "Example ISP");
  assert(calls == 3);

  // failure was not stored
  assert(geo.Locate("192.0.2.1", now).country_code == "?");
  assert(calls == 4);
}

void TestGeoResponseParsing() {
  auto ok = GeoLocator::ParseResponse(R"({"status":"success","country":"Netherlands","countryCode":"NL","city":"Amsterdam","isp":"Example"})");
  assert(ok.has_value());
  assert(ok->country_code == "NL");
  assert(ok->isp == "Example");

  assert(!GeoLocator::ParseResponse(R"({"status":"fail","message":"private range"})").has_value());
  assert(!GeoLocator::ParseResponse("<html>rate limited</html>").has_value());
}

void TestScanCachesEmptyResultButNotFailure() {
  auto repo  = OpenRepository("scan");
  int  calls = 0;

  AttackerScanner scanner(repo, 6h, [&](const std::string& ip) -> std::optional<ScanInfo> {
    ++calls;
    if (ip == "192.0.2.1") return std::nullopt;
    return ScanInfo{};
  });

  const auto now = cic::util::Now();

  assert(scanner.Scan("203.0.113.9", now).open_ports.empty());
  assert(scanner.Scan("203.0.113.9", now + 1h).open_ports.empty());
  assert(calls == 1);

  scanner.Scan("192.0.2.1", now);
  scanner.Scan("192.0.2.1", now);
  assert(calls == 3);

  scanner.Scan("203.0.113.9", now + 7h);
  assert(calls == 4);
}

void TestNmapParsing() {
  auto linux_host = AttackerScanner::ParseNmap("PORT    STATE SERVICE\n"
                                               "22/tcp  open  ssh\n"
                                               "80/tcp  open  http\n"
                                               "443/tcp filtered https\n");
  assert(linux_host.open_ports == "22,80");
  assert(linux_host.os_guess == "Linux");

  auto detailed = AttackerScanner::ParseNmap("3389/tcp open ms-wbt-server\n"
                                             "OS details: Microsoft Windows Server 2019 Datacenter Edition\n");
  assert(detailed.open_ports == "3389");
  assert(detailed.os_guess == "Microsoft Windows Server 2019 ");

  auto nothing = AttackerScanner::ParseNmap("All 20 scanned ports on 192.0.2.1 are filtered\n");
  assert(nothing.open_ports.empty());
  assert(nothing.os_guess.empty());
}

} // namespace

int main() {
  TestIpLiteralValidation();
  TestDnsHitMissAndExpiry();
  TestDnsFailuresAreNotCached();
  TestDnsOutputParsing();
  TestGeoCachesAndRateLimits();
  TestGeoResponseParsing();
  TestScanCachesEmptyResultButNotFailure();
  TestNmapParsing();

  std::cout << "cic_unit_lookup_cache: pass\n";
  return 0;
}
