#include "attacker_scanner.hpp"

#include <sstream>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/probe/command_runner.hpp"
#include "ip_address.hpp"

namespace cic::lookup {

using cic::observability::StringField;

AttackerScanner::AttackerScanner(std::shared_ptr<db::MetricsRepository> repository, std::chrono::seconds ttl, Fetcher fetcher)
    : repository_(std::move(repository)), ttl_(ttl), fetcher_(std::move(fetcher)) {
}

ScanInfo AttackerScanner::Scan(const std::string& ip, util::TimePoint now) {
  if (!IsIpLiteral(ip)) {
    CIC_LOG_WARN("Rejected scan of non-IP input", {StringField("input", ip)});
    return ScanInfo{};
  }

  {
    auto tx     = repository_->BeginRead();
    auto cached = repository_->GetAttackerScan(*tx, ip);
    tx->Commit();

    if (cached && util::ToUnixSeconds(now) - cached->scanned_at < static_cast<double>(ttl_.count())) {
      return ScanInfo{cached->open_ports, cached->os_guess};
    }
  }

  auto info = fetcher_(ip);
  if (!info) {
    CIC_LOG_DEBUG("Attacker scan failed", {StringField("ip", ip)});
    return ScanInfo{};
  }

  db::model::AttackerScanRecord row;
  row.ip         = ip;
  row.open_ports = info->open_ports;
  row.os_guess   = info->os_guess;
  row.scanned_at = util::ToUnixSeconds(now);

  auto tx = repository_->Begin();
  auto r  = repository_->UpsertAttackerScan(*tx, row);
  if (r) {
    tx->Commit();
  } else {
    CIC_LOG_WARN("Failed to cache attacker scan", {StringField("ip", ip), StringField("error", r.message)});
  }

  return *info;
}

AttackerScanner::Fetcher AttackerScanner::CommandFetcher(std::chrono::milliseconds timeout) {
  return [timeout](const std::string& ip) -> std::optional<ScanInfo> {
    auto nmap = probe::RunCommand({"nmap", "-sT", "--top-ports", "20", ip}, timeout);
    if (!nmap.Ok() || nmap.out.empty()) return std::nullopt;
    return ParseNmap(nmap.out);
  };
}

ScanInfo AttackerScanner::ParseNmap(const std::string& out) {
  ScanInfo                 info;
  std::vector<std::string> ports;

  std::istringstream in(out);
  std::string        line;
  while (std::getline(in, line)) {
    if (line.find("/tcp") != std::string::npos && line.find("open") != std::string::npos) {
      auto begin = line.find_first_not_of(" \t");
      if (begin == std::string::npos) continue;
      ports.push_back(line.substr(begin, line.find('/') - begin));
      continue;
    }

    if (info.os_guess.empty() && (line.find("OS details:") != std::string::npos || line.find("Running:") != std::string::npos)) {
      auto value = line.substr(line.find(':') + 1);
      value.erase(0, value.find_first_not_of(" \t"));
      while (!value.empty() && (value.back() == ' ' || value.back() == '\r')) value.pop_back();
      info.os_guess = value.substr(0, 30);
    }
  }

  for (std::size_t i = 0; i < ports.size(); ++i) {
    if (i) info.open_ports += ",";
    info.open_ports += ports[i];
  }

  if (info.os_guess.empty()) {
    for (const auto& p : ports) {
      if (p == "22") {
        info.os_guess = "Linux";
        break;
      }
    }
  }
  return info;
}

} // namespace cic::lookup
