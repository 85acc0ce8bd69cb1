#include "sqlite_metrics_repository.hpp"

#include <sqlite3.h>

#include <array>

namespace cic::db::sqlite {

using cic::db::ErrorCode;
using cic::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return nullptr;
  }
  return Stmt(st);
}

// Time-series tables and their timestamp column, in prune/stats order.
constexpr std::array<const char*, 6> kSeriesTables = {
    "server_metrics", "agent_metrics", "cron_metrics", "security_metrics", "port_scans", "network_metrics"};

struct LookupTable {
  const char* table;
  const char* stamp_column;
};

constexpr std::array<LookupTable, 3> kLookupTables = {{
    {"dns_cache", "resolved_at"},
    {"geo_cache", "resolved_at"},
    {"attacker_scans", "scanned_at"},
}};

} // namespace

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

static model::ServerSampleRecord ReadServerRow(sqlite3_stmt* st) {
    model::ServerSampleRecord r;
    r.timestamp     = ColDouble(st, 0);
    r.cpu_percent   = ColDouble(st, 1);
    r.mem_used_mb   = ColDouble(st, 2);
    r.mem_total_mb  = ColDouble(st, 3);
    r.disk_used_gb  = ColDouble(st, 4);
    r.disk_total_gb = ColDouble(st, 5);
    r.load_1m       = ColDouble(st, 6);
    r.load_5m       = ColDouble(st, 7);
    r.load_15m      = ColDouble(st, 8);
    return r;
}

static model::AgentSampleRecord ReadAgentRow(sqlite3_stmt* st) {
    model::AgentSampleRecord r;
    r.timestamp     = ColDouble(st, 0);
    r.agent_name    = ColText(st, 1);
    r.tokens_used   = ColI64(st, 2);
    r.sessions      = ColI64(st, 3);
    r.storage_bytes = ColI64(st, 4);
    r.model         = ColText(st, 5);
    return r;
}

SqliteMetricsRepository::SqliteMetricsRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteMetricsRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteMetricsRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kRead);
}

SqliteTransaction& SqliteMetricsRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteMetricsRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_FULL:
            return Result::Err(ErrorCode::Full, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Schema marker
// ------------------------------------------------------------------

std::optional<int> SqliteMetricsRepository::GetSchemaVersion(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT version FROM schema_version LIMIT 1;");
    if (!st) return std::nullopt;

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return sqlite3_column_int(st.get(), 0);
}

Result SqliteMetricsRepository::SetSchemaVersion(Transaction& t, int version) {
    auto* db = TX(t).Handle();

    auto del = Prepare(db, "DELETE FROM schema_version;");
    if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    int rc = sqlite3_step(del.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    auto st = Prepare(db, "INSERT INTO schema_version(version) VALUES(?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, version);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Time series (append)
// ------------------------------------------------------------------

Result SqliteMetricsRepository::InsertServerSample(Transaction& t, const model::ServerSampleRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO server_metrics(timestamp,cpu_percent,mem_used_mb,mem_total_mb,"
        "disk_used_gb,disk_total_gb,load_1m,load_5m,load_15m) VALUES(?,?,?,?,?,?,?,?,?);";

    auto st = Prepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindDouble(st.get(), 1, r.timestamp);
    BindDouble(st.get(), 2, r.cpu_percent);
    BindDouble(st.get(), 3, r.mem_used_mb);
    BindDouble(st.get(), 4, r.mem_total_mb);
    BindDouble(st.get(), 5, r.disk_used_gb);
    BindDouble(st.get(), 6, r.disk_total_gb);
    BindDouble(st.get(), 7, r.load_1m);
    BindDouble(st.get(), 8, r.load_5m);
    BindDouble(st.get(), 9, r.load_15m);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteMetricsRepository::InsertAgentSample(Transaction& t, const model::AgentSampleRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO agent_metrics(timestamp,agent_name,tokens_used,sessions,storage_bytes,model) "
        "VALUES(?,?,?,?,?,?);";

    auto st = Prepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindDouble(st.get(), 1, r.timestamp);
    BindText(st.get(), 2, r.agent_name);
    BindI64(st.get(), 3, r.tokens_used);
    BindI64(st.get(), 4, r.sessions);
    BindI64(st.get(), 5, r.storage_bytes);
    BindText(st.get(), 6, r.model);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteMetricsRepository::InsertCronSample(Transaction& t, const model::CronSampleRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO cron_metrics(timestamp,job_name,status,last_run,next_run) VALUES(?,?,?,?,?);";

    auto st = Prepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindDouble(st.get(), 1, r.timestamp);
    BindText(st.get(), 2, r.job_name);
    BindText(st.get(), 3, r.status);
    BindText(st.get(), 4, r.last_run);
    BindText(st.get(), 5, r.next_run);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteMetricsRepository::InsertSecuritySample(Transaction& t, const model::SecuritySampleRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO security_metrics(timestamp,ssh_intrusions,ports_open,ufw_active,"
        "fail2ban_active,root_login_enabled) VALUES(?,?,?,?,?,?);";

    auto st = Prepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindDouble(st.get(), 1, r.timestamp);
    BindI64(st.get(), 2, r.ssh_intrusions);
    BindI64(st.get(), 3, r.ports_open);
    BindI64(st.get(), 4, r.ufw_active ? 1 : 0);
    BindI64(st.get(), 5, r.fail2ban_active ? 1 : 0);
    BindI64(st.get(), 6, r.root_login_enabled ? 1 : 0);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteMetricsRepository::InsertPortScan(Transaction& t, const model::PortScanRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT INTO port_scans(timestamp,port,service,state) VALUES(?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindDouble(st.get(), 1, r.timestamp);
    BindI64(st.get(), 2, r.port);
    BindText(st.get(), 3, r.service);
    BindText(st.get(), 4, r.state);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteMetricsRepository::InsertNetworkSample(Transaction& t, const model::NetworkSampleRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT INTO network_metrics(timestamp,active_connections,unique_ips) VALUES(?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindDouble(st.get(), 1, r.timestamp);
    BindI64(st.get(), 2, r.active_connections);
    BindI64(st.get(), 3, r.unique_ips);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Time series (query)
// ------------------------------------------------------------------

std::optional<model::ServerSampleRecord> SqliteMetricsRepository::LatestServerSample(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT timestamp,cpu_percent,mem_used_mb,mem_total_mb,disk_used_gb,disk_total_gb,"
        "load_1m,load_5m,load_15m FROM server_metrics ORDER BY timestamp DESC LIMIT 1;";

    auto st = Prepare(db, sql);
    if (!st) return std::nullopt;

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadServerRow(st.get());
}

std::optional<model::ServerSampleRecord> SqliteMetricsRepository::ServerSampleAtOrBefore(Transaction& t, double cutoff) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT timestamp,cpu_percent,mem_used_mb,mem_total_mb,disk_used_gb,disk_total_gb,"
        "load_1m,load_5m,load_15m FROM server_metrics WHERE timestamp <= ? "
        "ORDER BY timestamp DESC LIMIT 1;";

    auto st = Prepare(db, sql);
    if (!st) return std::nullopt;

    BindDouble(st.get(), 1, cutoff);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadServerRow(st.get());
}

std::vector<std::string> SqliteMetricsRepository::AgentNamesSince(Transaction& t, double since) {
    auto* db = TX(t).Handle();

    std::vector<std::string> names;

    auto st = Prepare(db, "SELECT DISTINCT agent_name FROM agent_metrics WHERE timestamp >= ? ORDER BY agent_name;");
    if (!st) return names;

    BindDouble(st.get(), 1, since);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        names.push_back(ColText(st.get(), 0));
    }
    return names;
}

std::optional<model::AgentSampleRecord>
SqliteMetricsRepository::EarliestAgentSampleSince(Transaction& t, const std::string& agent, double since) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT timestamp,agent_name,tokens_used,sessions,storage_bytes,model FROM agent_metrics "
        "WHERE agent_name = ? AND timestamp >= ? ORDER BY timestamp ASC LIMIT 1;";

    auto st = Prepare(db, sql);
    if (!st) return std::nullopt;

    BindText(st.get(), 1, agent);
    BindDouble(st.get(), 2, since);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadAgentRow(st.get());
}

std::optional<model::AgentSampleRecord>
SqliteMetricsRepository::LatestAgentSample(Transaction& t, const std::string& agent) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT timestamp,agent_name,tokens_used,sessions,storage_bytes,model FROM agent_metrics "
        "WHERE agent_name = ? ORDER BY timestamp DESC LIMIT 1;";

    auto st = Prepare(db, sql);
    if (!st) return std::nullopt;

    BindText(st.get(), 1, agent);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadAgentRow(st.get());
}

std::optional<model::AgentSampleRecord>
SqliteMetricsRepository::AgentSampleAtOrBefore(Transaction& t, const std::string& agent, double cutoff) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT timestamp,agent_name,tokens_used,sessions,storage_bytes,model FROM agent_metrics "
        "WHERE agent_name = ? AND timestamp <= ? ORDER BY timestamp DESC LIMIT 1;";

    auto st = Prepare(db, sql);
    if (!st) return std::nullopt;

    BindText(st.get(), 1, agent);
    BindDouble(st.get(), 2, cutoff);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadAgentRow(st.get());
}

// ------------------------------------------------------------------
// Lookup caches
// ------------------------------------------------------------------

std::optional<model::DnsRecord> SqliteMetricsRepository::GetDns(Transaction& t, const std::string& ip) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT ip,hostname,resolved_at FROM dns_cache WHERE ip = ?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, ip);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::DnsRecord r;
    r.ip          = ColText(st.get(), 0);
    r.hostname    = ColText(st.get(), 1);
    r.resolved_at = ColDouble(st.get(), 2);
    return r;
}

Result SqliteMetricsRepository::UpsertDns(Transaction& t, const model::DnsRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT OR REPLACE INTO dns_cache(ip,hostname,resolved_at) VALUES(?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.ip);
    BindText(st.get(), 2, r.hostname);
    BindDouble(st.get(), 3, r.resolved_at);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::GeoRecord> SqliteMetricsRepository::GetGeo(Transaction& t, const std::string& ip) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT ip,country_code,city,isp,resolved_at FROM geo_cache WHERE ip = ?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, ip);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::GeoRecord r;
    r.ip           = ColText(st.get(), 0);
    r.country_code = ColText(st.get(), 1);
    r.city         = ColText(st.get(), 2);
    r.isp          = ColText(st.get(), 3);
    r.resolved_at  = ColDouble(st.get(), 4);
    return r;
}

Result SqliteMetricsRepository::UpsertGeo(Transaction& t, const model::GeoRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT OR REPLACE INTO geo_cache(ip,country_code,city,isp,resolved_at) VALUES(?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.ip);
    BindText(st.get(), 2, r.country_code);
    BindText(st.get(), 3, r.city);
    BindText(st.get(), 4, r.isp);
    BindDouble(st.get(), 5, r.resolved_at);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AttackerScanRecord> SqliteMetricsRepository::GetAttackerScan(Transaction& t, const std::string& ip) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT ip,open_ports,os_guess,scanned_at FROM attacker_scans WHERE ip = ?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, ip);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::AttackerScanRecord r;
    r.ip         = ColText(st.get(), 0);
    r.open_ports = ColText(st.get(), 1);
    r.os_guess   = ColText(st.get(), 2);
    r.scanned_at = ColDouble(st.get(), 3);
    return r;
}

Result SqliteMetricsRepository::UpsertAttackerScan(Transaction& t, const model::AttackerScanRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT OR REPLACE INTO attacker_scans(ip,open_ports,os_guess,scanned_at) VALUES(?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.ip);
    BindText(st.get(), 2, r.open_ports);
    BindText(st.get(), 3, r.os_guess);
    BindDouble(st.get(), 4, r.scanned_at);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

Result SqliteMetricsRepository::DeleteOlderThan(Transaction& t, double cutoff, int64_t& deleted) {
    auto* db = TX(t).Handle();
    deleted  = 0;

    auto run = [&](const std::string& sql) -> Result {
        auto st = Prepare(db, sql.c_str());
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindDouble(st.get(), 1, cutoff);
        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);

        deleted += sqlite3_changes(db);
        return Result::Ok();
    };

    for (const char* table : kSeriesTables) {
        auto r = run(std::string("DELETE FROM ") + table + " WHERE timestamp < ?;");
        if (!r) return r;
    }

    for (const auto& lookup : kLookupTables) {
        auto r = run(std::string("DELETE FROM ") + lookup.table + " WHERE " + lookup.stamp_column + " < ?;");
        if (!r) return r;
    }

    return Result::Ok();
}

std::vector<TableStat> SqliteMetricsRepository::Stats(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<TableStat> stats;

    for (const char* table : kSeriesTables) {
        const std::string sql = std::string("SELECT COUNT(*), MAX(timestamp) FROM ") + table + ";";
        auto st = Prepare(db, sql.c_str());
        if (!st || sqlite3_step(st.get()) != SQLITE_ROW) continue;

        TableStat stat;
        stat.table = table;
        stat.rows  = ColI64(st.get(), 0);
        if (sqlite3_column_type(st.get(), 1) != SQLITE_NULL) {
            stat.newest = ColDouble(st.get(), 1);
        }
        stats.push_back(std::move(stat));
    }

    for (const auto& lookup : kLookupTables) {
        const std::string sql = std::string("SELECT COUNT(*) FROM ") + lookup.table + ";";
        auto st = Prepare(db, sql.c_str());
        if (!st || sqlite3_step(st.get()) != SQLITE_ROW) continue;

        TableStat stat;
        stat.table = lookup.table;
        stat.rows  = ColI64(st.get(), 0);
        stats.push_back(std::move(stat));
    }

    return stats;
}

} // namespace cic::db::sqlite
