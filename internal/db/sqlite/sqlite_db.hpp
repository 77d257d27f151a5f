#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace cirrus::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  busy_timeout_ms is the dependency timeout ceiling: a lock held longer than
  that surfaces as util::DependencyUnavailable.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, uint64_t busy_timeout_ms, bool wal_mode);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // One transaction at a time per connection. Waits up to the busy timeout.
  std::unique_lock<std::timed_mutex> LockForTransaction();

 private:
  void Configure(uint64_t busy_timeout_ms, bool wal_mode);

  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
  std::timed_mutex          tx_mutex_;
};

// Throws util::DependencyUnavailable for BUSY/LOCKED, std::runtime_error otherwise.
void ThrowIfSqliteError(int rc, sqlite3* db, const std::string& what);

} // namespace cirrus::db::sqlite
