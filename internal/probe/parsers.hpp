#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/bundles.hpp"

namespace cic::probe::parse {

/*
  Pure parsers for the text the probes collect.

  None of these touch the filesystem or spawn processes, so every format is
  testable from captured output. Unparseable input yields defaults or an empty
  optional; the caller decides whether that is a failure.
*/

// ------------------------------------------------------------------
// Sizes
// ------------------------------------------------------------------

// "3.2G" -> 3.2, "512M" -> 0.5, "7.7Gi" -> 7.7. Bare numbers are bytes.
double SizeToGb(std::string_view text);

// "27M" -> 28311552. Bare numbers are bytes.
int64_t SizeToBytes(std::string_view text);

// ------------------------------------------------------------------
// Host
// ------------------------------------------------------------------

// `free -m`: fills mem_used_mb / mem_total_mb / mem_percent.
bool ParseFree(const std::string& out, model::ServerHealth& health);

// `df -h /`: fills disk_used_gb / disk_total_gb / disk_percent.
bool ParseDf(const std::string& out, model::ServerHealth& health);

// `uptime`: fills load_avg and uptime.
bool ParseUptime(const std::string& out, model::ServerHealth& health);

// First seven counters of the aggregate "cpu" line of /proc/stat.
using CpuSample = std::array<uint64_t, 7>;

std::optional<CpuSample> ParseProcStat(const std::string& first_line);

// Busy share between two samples, 0 when no time elapsed.
double CpuPercent(const CpuSample& previous, const CpuSample& current);

// `ps aux --sort=-%cpu`: header skipped, at most `limit` rows.
model::ProcessList ParsePsAux(const std::string& out, std::size_t limit);

// `ss -tnp`: established peers, loopback excluded.
model::NetworkActivity ParseSsConnections(const std::string& out);

// `nmap -sT <host>`: rows like "22/tcp open ssh".
std::vector<model::PortInfo> ParseNmapPorts(const std::string& out);

// `ss -tlnp`: listening sockets; service falls back to "port-<n>".
std::vector<model::PortInfo> ParseSsListening(const std::string& out);

// ------------------------------------------------------------------
// Auth log
// ------------------------------------------------------------------

// Lines containing "Failed password" or "Invalid user".
int64_t CountIntrusions(const std::string& auth_log);

// Accepted / failed SSH sources over the last `window` matching lines of
// each kind, top `top_n` by count (ties broken by IP).
model::SshLoginSummary ParseSshLogins(const std::string& auth_log, std::size_t top_n, std::size_t window = 500);

// Last `limit` "Accepted" / "session opened" lines as ssh events.
std::vector<model::LogEvent> ParseAuthEvents(const std::string& auth_log, std::size_t limit);

// ------------------------------------------------------------------
// Agent service CLI
// ------------------------------------------------------------------

// `<cli> agents list`.
model::AgentFleet ParseAgentsList(const std::string& out);

// Sums the "<used>k/<limit>k (<pct>%)" columns of every "agent:<name>:"
// session line of `<cli> status` into tokens_used and sessions.
void ApplySessionTokens(const std::string& status_out, model::AgentFleet& fleet);

// `<cli> status [--json]`. JSON is tried first, then "key: value" lines.
model::ServiceStatus ParseServiceStatus(const std::string& out);

// `<cli> cron list`: fixed-width columns located from the header row.
model::CronJobs ParseCronList(const std::string& out);

// Box-drawn "Channels" table of `<cli> status`.
model::ChannelList ParseChannels(const std::string& out);

model::UpdateStatus ParseUpdateStatus(const std::string& out);

// `<cli> system events --json`, or plain lines stamped with `now_hhmm`.
std::vector<model::LogEvent> ParseSystemEvents(const std::string& out, const std::string& now_hhmm, std::size_t limit);

// Log tail lines; "==>" headers skipped, messages cut to 80 chars.
model::EventLog ParseServiceLogs(const std::string& out, const std::string& now_hhmm, std::size_t limit);

// "error"/"fail" -> error, "warn" -> warning, else info.
std::string DetectLevel(std::string_view line);

} // namespace cic::probe::parse
