#pragma once

#include <cstdint>
#include <string>

namespace cic::db::model {

/*
  Rows of the time-series tables. `timestamp` is float seconds since epoch.
*/

struct ServerSampleRecord {
  double timestamp     = 0.0;
  double cpu_percent   = 0.0;
  double mem_used_mb   = 0.0;
  double mem_total_mb  = 0.0;
  double disk_used_gb  = 0.0;
  double disk_total_gb = 0.0;
  double load_1m       = 0.0;
  double load_5m       = 0.0;
  double load_15m      = 0.0;
};

struct AgentSampleRecord {
  double      timestamp = 0.0;
  std::string agent_name;
  int64_t     tokens_used   = 0;
  int64_t     sessions      = 0;
  int64_t     storage_bytes = 0;
  std::string model;
};

struct CronSampleRecord {
  double      timestamp = 0.0;
  std::string job_name;
  std::string status = "idle";
  std::string last_run;
  std::string next_run;
};

struct SecuritySampleRecord {
  double  timestamp          = 0.0;
  int64_t ssh_intrusions     = 0;
  int64_t ports_open         = 0;
  bool    ufw_active         = false;
  bool    fail2ban_active    = false;
  bool    root_login_enabled = true;
};

struct PortScanRecord {
  double      timestamp = 0.0;
  int         port      = 0;
  std::string service;
  std::string state = "open";
};

struct NetworkSampleRecord {
  double  timestamp          = 0.0;
  int64_t active_connections = 0;
  int64_t unique_ips         = 0;
};

} // namespace cic::db::model
