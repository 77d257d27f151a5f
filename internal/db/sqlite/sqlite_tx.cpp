#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace cirrus::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->LockForTransaction()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& ex) {
      CIRRUS_LOG_WARN("sqlite rollback failed", {cirrus::observability::StringField("error", ex.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  committed_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace cirrus::db::sqlite
