#include "snapshot.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "internal/model/sources.hpp"

namespace cic::runtime {

namespace sources = cic::model::sources;

namespace {

constexpr int64_t kSshErrorThreshold     = 5;
constexpr int64_t kIntrusionActionLimit  = 50;
constexpr int64_t kExtraPortsTolerated   = 2;
constexpr double  kDiskWarnPercent       = 80.0;
constexpr double  kMemWarnPercent        = 80.0;
constexpr double  kCpuWarnPercent        = 90.0;

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

// "2026-10-18 14:03:22" -> "14:03"
std::string ClockOf(const std::string& timestamp) {
  if (timestamp.size() < 8) return "??:??";
  return timestamp.substr(timestamp.size() - 8, 5);
}

std::string LastFive(const std::string& s) {
  if (s.empty()) return "??:??";
  return s.size() <= 5 ? s : s.substr(s.size() - 5);
}

std::string Percent(double v) {
  return std::to_string(static_cast<int64_t>(std::lround(v))) + "%";
}

} // namespace

// ------------------------------------------------------------------
// Derived summaries
// ------------------------------------------------------------------

std::vector<model::LogEvent> DeriveErrors(const Snapshot& snapshot) {
  std::vector<model::LogEvent> errors;

  if (const auto* cron = snapshot.Get<model::CronJobs>(sources::kCronJobs)) {
    for (const auto& job : cron->jobs) {
      if (job.status != "error") continue;
      errors.push_back({LastFive(job.last_run), job.name + ": delivery failed", "cron", "error"});
    }
  }

  if (const auto* ssh = snapshot.Get<model::SshLoginSummary>(sources::kSshLoginSummary)) {
    for (const auto& source : ssh->failed) {
      if (source.count < kSshErrorThreshold) continue;
      errors.push_back({ClockOf(source.last_seen), std::to_string(source.count) + " failed attempts from " + source.ip, "ssh", "error"});
    }
  }

  if (const auto* logs = snapshot.Get<model::EventLog>(sources::kOpenclawLogs)) {
    for (const auto& ev : logs->events) {
      if (ev.level == "error") errors.push_back(ev);
    }
  }

  return errors;
}

std::vector<ActionItem> DeriveActions(const Snapshot& snapshot) {
  std::vector<ActionItem> items;

  if (const auto* cron = snapshot.Get<model::CronJobs>(sources::kCronJobs)) {
    for (const auto& job : cron->jobs) {
      if (Lower(job.status) == "error") items.push_back({"error", (job.name.empty() ? "Unknown" : job.name) + " cron failed"});
    }
  }

  if (const auto* sec = snapshot.Get<model::SecurityStatus>(sources::kSecurityStatus)) {
    if (sec->ssh_intrusions > kIntrusionActionLimit) {
      items.push_back({"error", std::to_string(sec->ssh_intrusions) + " SSH intrusion attempts"});
    }
    if (sec->listening_ports > sec->expected_ports + kExtraPortsTolerated) {
      items.push_back({"warn", std::to_string(sec->listening_ports) + " listening ports (expected ~" + std::to_string(sec->expected_ports) + ")"});
    }
  }

  if (const auto* update = snapshot.Get<model::UpdateStatus>(sources::kUpdateStatus)) {
    if (update->available) items.push_back({"warn", "OpenClaw update: " + (update->latest.empty() ? std::string("?") : update->latest)});
  }

  if (const auto* channels = snapshot.Get<model::ChannelList>(sources::kChannelsStatus)) {
    for (const auto& ch : channels->channels) {
      if (Upper(ch.state) == "WARN") items.push_back({"warn", ch.name + ": " + (ch.detail.empty() ? std::string("warning") : ch.detail)});
    }
  }

  if (const auto* health = snapshot.Get<model::ServerHealth>(sources::kServerHealth)) {
    if (health->disk_percent > kDiskWarnPercent) items.push_back({"warn", "Disk usage: " + Percent(health->disk_percent)});
    if (health->mem_percent > kMemWarnPercent) items.push_back({"warn", "Memory usage: " + Percent(health->mem_percent)});
    if (health->cpu_percent > kCpuWarnPercent) items.push_back({"warn", "CPU usage: " + Percent(health->cpu_percent)});
  }

  return items;
}

// ------------------------------------------------------------------
// Build
// ------------------------------------------------------------------

Snapshot BuildSnapshot(const cache::TieredCache& cache, const trend::TrendEngine* trends, util::TimePoint now) {
  Snapshot snapshot;
  snapshot.entries = cache.Entries();

  if (trends) {
    snapshot.server_trends   = trends->GetServerTrends(now);
    snapshot.tokens_per_hour = trends->GetAgentTokensPerHour(now);
    snapshot.token_trends    = trends->GetAgentTokenTrends(now);
  }

  snapshot.errors       = DeriveErrors(snapshot);
  snapshot.actions      = DeriveActions(snapshot);
  snapshot.published_at = now;
  return snapshot;
}

} // namespace cic::runtime
