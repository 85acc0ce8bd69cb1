#include "dns_resolver.hpp"

#include <regex>

#include "internal/observability/logging.hpp"
#include "internal/probe/command_runner.hpp"
#include "ip_address.hpp"

namespace cic::lookup {

using cic::observability::StringField;

DnsResolver::DnsResolver(std::shared_ptr<db::MetricsRepository> repository, std::chrono::seconds ttl, Fetcher fetcher)
    : repository_(std::move(repository)), ttl_(ttl), fetcher_(std::move(fetcher)) {
}

std::string DnsResolver::Resolve(const std::string& ip, util::TimePoint now) {
  if (!IsIpLiteral(ip)) {
    CIC_LOG_WARN("Rejected reverse lookup of non-IP input", {StringField("input", ip)});
    return kUnknownHostname;
  }

  {
    auto tx     = repository_->BeginRead();
    auto cached = repository_->GetDns(*tx, ip);
    tx->Commit();

    if (cached && util::ToUnixSeconds(now) - cached->resolved_at < static_cast<double>(ttl_.count())) {
      return cached->hostname;
    }
  }

  auto hostname = fetcher_(ip);
  if (!hostname || hostname->empty()) {
    CIC_LOG_DEBUG("Reverse lookup failed", {StringField("ip", ip)});
    return kUnknownHostname;
  }

  db::model::DnsRecord row;
  row.ip          = ip;
  row.hostname    = *hostname;
  row.resolved_at = util::ToUnixSeconds(now);

  auto tx = repository_->Begin();
  auto r  = repository_->UpsertDns(*tx, row);
  if (r) {
    tx->Commit();
  } else {
    CIC_LOG_WARN("Failed to cache hostname", {StringField("ip", ip), StringField("error", r.message)});
  }

  return *hostname;
}

DnsResolver::Fetcher DnsResolver::CommandFetcher(std::chrono::milliseconds timeout) {
  return [timeout](const std::string& ip) -> std::optional<std::string> {
    auto dig = probe::RunCommand({"dig", "-x", ip, "+short", "+time=2", "+tries=1"}, timeout);
    if (dig.Ok()) {
      if (auto name = ParseDig(dig.out)) return name;
    }

    auto host = probe::RunCommand({"host", ip}, timeout);
    if (host.Ok()) return ParseHost(host.out);

    return std::nullopt;
  };
}

std::optional<std::string> DnsResolver::ParseDig(const std::string& out) {
  std::string first = out.substr(0, out.find('\n'));
  while (!first.empty() && (first.back() == '.' || first.back() == ' ' || first.back() == '\r')) first.pop_back();

  // dig reports resolver trouble on stdout prefixed with ';;'
  if (first.empty() || first.rfind(";;", 0) == 0) return std::nullopt;
  return first;
}

std::optional<std::string> DnsResolver::ParseHost(const std::string& out) {
  static const std::regex kPointer(R"(domain name pointer\s+(\S+))");

  std::smatch m;
  if (!std::regex_search(out, m, kPointer)) return std::nullopt;

  std::string name = m[1].str();
  while (!name.empty() && name.back() == '.') name.pop_back();
  if (name.empty()) return std::nullopt;
  return name;
}

} // namespace cic::lookup
