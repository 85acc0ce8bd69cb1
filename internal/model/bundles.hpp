#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cic::model {

/*
  Structured results of the probes.

  Each probe produces exactly one of these; the scheduler, the cache and the
  metrics store agree on the shape through the Bundle variant below.
*/

struct ServerHealth {
  double cpu_percent  = 0.0;
  double mem_used_mb  = 0.0;
  double mem_total_mb = 0.0;
  double mem_percent  = 0.0;

  double disk_used_gb  = 0.0;
  double disk_total_gb = 0.0;
  double disk_percent  = 0.0;

  std::array<double, 3> load_avg{0.0, 0.0, 0.0};
  std::string           uptime = "unknown";
};

struct ProcessInfo {
  std::string pid;
  std::string user;
  double      cpu = 0.0;
  double      mem = 0.0;
  std::string command;
};

struct ProcessList {
  std::vector<ProcessInfo> processes;
};

struct CronJob {
  std::string name;
  std::string status = "idle"; // idle | ok | running | error
  std::string last_run;
  std::string next_run;
  std::string agent;
};

struct CronJobs {
  std::vector<CronJob> jobs;
};

struct LogEvent {
  std::string time;
  std::string message;
  std::string type  = "openclaw";
  std::string level = "info"; // info | warning | error
};

// Used by both the activity feed and the agent service log tail.
struct EventLog {
  std::vector<LogEvent> events;
};

struct NetworkActivity {
  int64_t                        active_connections = 0;
  int64_t                        unique_ips         = 0;
  std::map<std::string, int64_t> peer_ips;
};

struct AgentInfo {
  std::string name;
  std::string status = "online";
  std::string model;
  std::string workspace;
  bool        is_default    = false;
  int64_t     tokens_used   = 0;
  int64_t     sessions      = 0;
  int64_t     storage_bytes = 0;
};

struct AgentFleet {
  std::vector<AgentInfo> agents;
};

struct ServiceStatus {
  int64_t     sessions       = 0;
  std::string model          = "unknown";
  std::string gateway_status = "unknown";
  std::string version        = "unknown";
};

struct PortInfo {
  int         port = 0;
  std::string service;
  std::string state = "open";
};

struct SecurityStatus {
  int64_t               ssh_intrusions     = 0;
  int64_t               listening_ports    = 0;
  int64_t               expected_ports     = 4;
  bool                  ufw_active         = false;
  bool                  fail2ban_active    = false;
  bool                  root_login_enabled = true;
  std::vector<PortInfo> ports;
};

struct LoginSource {
  std::string ip;
  int64_t     count = 0;
  std::string last_seen;
};

struct SshLoginSummary {
  std::vector<LoginSource> accepted;
  std::vector<LoginSource> failed;
};

struct Channel {
  std::string name;
  std::string enabled;
  std::string state;
  std::string detail;
};

struct ChannelList {
  std::vector<Channel> channels;
};

struct UpdateStatus {
  bool        available = false;
  std::string current;
  std::string latest;
};

struct AttackerProfile {
  std::string ip;
  int64_t     failed_attempts = 0;
  std::string hostname        = "unknown";
  std::string country_code    = "?";
  std::string city;
  std::string isp;
  std::string open_ports;
  std::string os_guess;
};

// Output of the glacial enrichment pass.
struct ThreatIntel {
  std::vector<AttackerProfile> attackers;
};

using Bundle = std::variant<ServerHealth,
                            ProcessList,
                            CronJobs,
                            EventLog,
                            NetworkActivity,
                            AgentFleet,
                            ServiceStatus,
                            SecurityStatus,
                            SshLoginSummary,
                            ChannelList,
                            UpdateStatus,
                            ThreatIntel>;

} // namespace cic::model
