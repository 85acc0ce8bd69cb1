#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace cic::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS schema_version (version INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS server_metrics (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp REAL NOT NULL, cpu_percent REAL DEFAULT 0, mem_used_mb REAL DEFAULT 0, mem_total_mb REAL DEFAULT 0, disk_used_gb REAL DEFAULT 0, disk_total_gb REAL DEFAULT 0, load_1m REAL DEFAULT 0, load_5m REAL DEFAULT 0, load_15m REAL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS agent_metrics (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp REAL NOT NULL, agent_name TEXT NOT NULL, tokens_used INTEGER DEFAULT 0, sessions INTEGER DEFAULT 0, storage_bytes INTEGER DEFAULT 0, model TEXT DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS cron_metrics (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp REAL NOT NULL, job_name TEXT NOT NULL, status TEXT DEFAULT 'idle', last_run TEXT DEFAULT '', next_run TEXT DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS security_metrics (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp REAL NOT NULL, ssh_intrusions INTEGER DEFAULT 0, ports_open INTEGER DEFAULT 0, ufw_active INTEGER DEFAULT 0, fail2ban_active INTEGER DEFAULT 0, root_login_enabled INTEGER DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS port_scans (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp REAL NOT NULL, port INTEGER NOT NULL, service TEXT DEFAULT '', state TEXT DEFAULT 'open');",
      "CREATE TABLE IF NOT EXISTS network_metrics (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp REAL NOT NULL, active_connections INTEGER DEFAULT 0, unique_ips INTEGER DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS dns_cache (ip TEXT PRIMARY KEY, hostname TEXT DEFAULT '', resolved_at REAL NOT NULL);",
      "CREATE TABLE IF NOT EXISTS geo_cache (ip TEXT PRIMARY KEY, country_code TEXT DEFAULT '', city TEXT DEFAULT '', isp TEXT DEFAULT '', resolved_at REAL NOT NULL);",
      "CREATE TABLE IF NOT EXISTS attacker_scans (ip TEXT PRIMARY KEY, open_ports TEXT DEFAULT '', os_guess TEXT DEFAULT '', scanned_at REAL NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_server_ts ON server_metrics(timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_agent_ts ON agent_metrics(timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_agent_name_ts ON agent_metrics(agent_name, timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_cron_ts ON cron_metrics(timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_security_ts ON security_metrics(timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_port_scans_ts ON port_scans(timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_network_ts ON network_metrics(timestamp);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace cic::db::sqlite
