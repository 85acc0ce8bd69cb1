#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace cic::db::sqlite {

inline constexpr int kSchemaVersion = 1;

// Creates every table and index if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace cic::db::sqlite
