#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace relations::db::sqlite {

/*
  Thin RAII wrapper around a single sqlite3* connection.

  One connection serves the whole process. SQLite allows one open
  transaction per connection, so SqliteTransaction holds TxMutex() for
  its lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
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

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace relations::db::sqlite
