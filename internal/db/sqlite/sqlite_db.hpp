#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace cic::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the collector threads; TxMutex() serializes
  transactions on it. Other processes (cicctl) read concurrently through WAL.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace cic::db::sqlite
