#include "sqlite_db.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace cirrus::db::sqlite {

void ThrowIfSqliteError(int rc, sqlite3* db, const std::string& what) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) {
    return;
  }
  const std::string message = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  const int         primary = rc & 0xFF;
  if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    throw util::DependencyUnavailable(message);
  }
  throw std::runtime_error(message);
}

SqliteDB::SqliteDB(std::string path, uint64_t busy_timeout_ms, bool wal_mode)
    : path_(std::move(path)), busy_timeout_(static_cast<std::chrono::milliseconds::rep>(busy_timeout_ms)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure(busy_timeout_ms, wal_mode);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    ThrowIfSqliteError(rc, nullptr, msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIfSqliteError(rc, db_, "sqlite prepare");
  return stmt;
}

std::unique_lock<std::timed_mutex> SqliteDB::LockForTransaction() {
  std::unique_lock<std::timed_mutex> lock(tx_mutex_, std::defer_lock);
  if (!lock.try_lock_for(busy_timeout_)) {
    throw util::DependencyUnavailable("sqlite: timed out waiting for transaction lock on " + path_);
  }
  return lock;
}

void SqliteDB::Configure(uint64_t busy_timeout_ms, bool wal_mode) {
  // primary key and unique violations are told apart by their extended codes
  ThrowIfSqliteError(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");

  // WAL lets readers proceed while a writer holds the lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks up to the dependency ceiling instead of failing immediately
  const auto timeout = static_cast<int>(std::min<uint64_t>(busy_timeout_ms, std::numeric_limits<int>::max()));
  ThrowIfSqliteError(sqlite3_busy_timeout(db_, timeout), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace cirrus::db::sqlite
