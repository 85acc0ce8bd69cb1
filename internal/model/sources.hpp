#pragma once

namespace cic::model::sources {

/*
  Cache keys of the default probe set.
*/

// fast
inline constexpr const char* kServerHealth = "server_health";
inline constexpr const char* kTopProcesses = "top_processes";

// medium
inline constexpr const char* kCronJobs        = "cron_jobs";
inline constexpr const char* kActivityLog     = "activity_log";
inline constexpr const char* kOpenclawLogs    = "openclaw_logs";
inline constexpr const char* kNetworkActivity = "network_activity";

// slow
inline constexpr const char* kAgentsData      = "agents_data";
inline constexpr const char* kOpenclawStatus  = "openclaw_status";
inline constexpr const char* kSecurityStatus  = "security_status";
inline constexpr const char* kSshLoginSummary = "ssh_login_summary";
inline constexpr const char* kChannelsStatus  = "channels_status";
inline constexpr const char* kUpdateStatus    = "update_status";

// glacial
inline constexpr const char* kGlacialEnrichment = "glacial_enrichment";

} // namespace cic::model::sources
