#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <limits>
#include <string>
#include <vector>

namespace cirrus::db::sqlite {

using cirrus::db::ErrorCode;
using cirrus::db::Result;
using model::SegmentStatus;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    ThrowIfSqliteError(sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr), db, "sqlite prepare");
  }
  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  // SQLITE_ROW or SQLITE_DONE; anything else throws.
  int Step() {
    const int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      ThrowIfSqliteError(rc, db_, "sqlite step");
    }
    return rc;
  }

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptionalU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

model::VersionRecord ReadVersion(sqlite3_stmt* st) {
  model::VersionRecord r;
  r.key          = ColText(st, 0);
  r.unified_id   = ColU64(st, 1);
  r.tombstone    = sqlite3_column_int(st, 2) != 0;
  r.timestamp_ms = ColU64(st, 3);
  r.size         = ColU64(st, 4);
  return r;
}

model::ConjoinedRecord ReadConjoined(sqlite3_stmt* st) {
  model::ConjoinedRecord r;
  r.collection_id = ColU64(st, 0);
  r.unified_id    = ColU64(st, 1);
  r.key           = ColText(st, 2);
  r.create_ms     = ColU64(st, 3);
  r.abort_ms      = ColOptionalU64(st, 4);
  r.complete_ms   = ColOptionalU64(st, 5);
  return r;
}

// Prefix filter that does not depend on LIKE escaping.
constexpr const char* kPrefixFilter = "substr(object_key, 1, length(?{n})) = ?{n}";

std::string WithPrefixParam(std::string sql, int n) {
  const std::string placeholder = "?{n}";
  const std::string param       = "?" + std::to_string(n);
  for (auto pos = sql.find(placeholder); pos != std::string::npos; pos = sql.find(placeholder, pos)) {
    sql.replace(pos, placeholder.size(), param);
  }
  return sql;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS collection (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE, access_control TEXT NOT NULL, password_sha256 TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS segment (collection_id INTEGER NOT NULL REFERENCES collection(id), object_key TEXT NOT NULL, unified_id INTEGER NOT NULL, conjoined_part INTEGER NOT NULL, sequence_no INTEGER NOT NULL, segment_offset INTEGER NOT NULL, size INTEGER NOT NULL, timestamp_ms INTEGER NOT NULL, storage_location TEXT NOT NULL, status INTEGER NOT NULL, PRIMARY KEY (collection_id, unified_id, conjoined_part, sequence_no));",
      "CREATE INDEX IF NOT EXISTS segment_key_idx ON segment (collection_id, object_key, unified_id);",
      "CREATE TABLE IF NOT EXISTS conjoined (collection_id INTEGER NOT NULL REFERENCES collection(id), unified_id INTEGER NOT NULL, object_key TEXT NOT NULL, create_ms INTEGER NOT NULL, abort_ms INTEGER, complete_ms INTEGER, PRIMARY KEY (collection_id, unified_id));"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------

Result SqliteRepository::InsertCollection(Transaction& t, model::CollectionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO collection(name,access_control,password_sha256,created_at_ms) VALUES(?,?,?,?);");
  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.access_control);
  BindText(st.get(), 3, r.password_sha256);
  BindU64(st.get(), 4, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return Translate(db, rc);
}

std::optional<model::CollectionRecord> SqliteRepository::GetCollectionByName(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id,name,access_control,password_sha256,created_at_ms FROM collection WHERE name=?;");
  BindText(st.get(), 1, name);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::CollectionRecord r;
  r.id              = ColU64(st.get(), 0);
  r.name            = ColText(st.get(), 1);
  r.access_control  = ColText(st.get(), 2);
  r.password_sha256 = ColText(st.get(), 3);
  r.created_at_ms   = ColU64(st.get(), 4);
  return r;
}

// ------------------------------------------------------------------
// Segments
// ------------------------------------------------------------------

Result SqliteRepository::InsertSegment(Transaction& t, const model::SegmentRecord& r) {
  auto* db = TX(t).Handle();

  // a unified id belongs to exactly one key
  {
    Statement owner(db, "SELECT object_key FROM segment WHERE collection_id=? AND unified_id=? LIMIT 1;");
    BindU64(owner.get(), 1, r.collection_id);
    BindU64(owner.get(), 2, r.unified_id);
    if (owner.Step() == SQLITE_ROW && ColText(owner.get(), 0) != r.key) {
      return Result::Err(ErrorCode::ConstraintViolation, "unified id already belongs to another key");
    }
  }

  Statement st(db,
               "INSERT INTO segment(collection_id,object_key,unified_id,conjoined_part,sequence_no,segment_offset,size,timestamp_ms,"
               "storage_location,status) VALUES(?,?,?,?,?,?,?,?,?,?);");
  BindU64(st.get(), 1, r.collection_id);
  BindText(st.get(), 2, r.key);
  BindU64(st.get(), 3, r.unified_id);
  BindU64(st.get(), 4, r.conjoined_part);
  BindU64(st.get(), 5, r.sequence_no);
  BindU64(st.get(), 6, r.offset);
  BindU64(st.get(), 7, r.size);
  BindU64(st.get(), 8, r.timestamp_ms);
  BindText(st.get(), 9, r.storage_location);
  sqlite3_bind_int(st.get(), 10, static_cast<int>(r.status));

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::SegmentRecord> SqliteRepository::GetSegments(Transaction& t, uint64_t collection_id, uint64_t unified_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT collection_id,object_key,unified_id,conjoined_part,sequence_no,segment_offset,size,timestamp_ms,storage_location,status "
               "FROM segment WHERE collection_id=? AND unified_id=? ORDER BY conjoined_part, sequence_no;");
  BindU64(st.get(), 1, collection_id);
  BindU64(st.get(), 2, unified_id);

  std::vector<model::SegmentRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::SegmentRecord r;
    r.collection_id    = ColU64(st.get(), 0);
    r.key              = ColText(st.get(), 1);
    r.unified_id       = ColU64(st.get(), 2);
    r.conjoined_part   = static_cast<uint32_t>(ColU64(st.get(), 3));
    r.sequence_no      = static_cast<uint32_t>(ColU64(st.get(), 4));
    r.offset           = ColU64(st.get(), 5);
    r.size             = ColU64(st.get(), 6);
    r.timestamp_ms     = ColU64(st.get(), 7);
    r.storage_location = ColText(st.get(), 8);
    r.status           = static_cast<SegmentStatus>(sqlite3_column_int(st.get(), 9));
    out.push_back(std::move(r));
  }
  return out;
}

std::optional<model::VersionRecord> SqliteRepository::GetCurrentVersion(Transaction& t, uint64_t collection_id, const std::string& key) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT object_key, unified_id, MAX(status = 2), MAX(timestamp_ms), SUM(size) FROM segment "
               "WHERE collection_id=? AND object_key=? AND status IN (1, 2) "
               "GROUP BY unified_id ORDER BY unified_id DESC LIMIT 1;");
  BindU64(st.get(), 1, collection_id);
  BindText(st.get(), 2, key);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadVersion(st.get());
}

std::vector<model::VersionRecord> SqliteRepository::ListLiveKeys(Transaction& t, uint64_t collection_id, const std::string& prefix,
                                                                 const std::string& marker, uint32_t limit) {
  auto* db = TX(t).Handle();

  const auto sql = WithPrefixParam(
      std::string("SELECT s.object_key, s.unified_id, 0, MAX(s.timestamp_ms), SUM(s.size) FROM segment s "
                  "WHERE s.collection_id=?1 AND s.status=1 AND s.object_key > ?2 AND ") +
          kPrefixFilter +
          " AND s.unified_id = (SELECT MAX(c.unified_id) FROM segment c WHERE c.collection_id=s.collection_id "
          "AND c.object_key=s.object_key AND c.status IN (1, 2)) "
          "GROUP BY s.object_key, s.unified_id ORDER BY s.object_key LIMIT ?4;",
      3);

  Statement st(db, sql.c_str());
  BindU64(st.get(), 1, collection_id);
  BindText(st.get(), 2, marker);
  BindText(st.get(), 3, prefix);
  BindU64(st.get(), 4, limit);

  std::vector<model::VersionRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadVersion(st.get()));
  }
  return out;
}

std::vector<model::VersionRecord> SqliteRepository::ListVersions(Transaction& t, uint64_t collection_id, const std::string& prefix,
                                                                 const std::string& key_marker, uint64_t version_marker, uint32_t limit) {
  auto* db = TX(t).Handle();

  const auto sql = WithPrefixParam(std::string("SELECT object_key, unified_id, MAX(status = 2), MAX(timestamp_ms), SUM(size) FROM segment "
                                               "WHERE collection_id=?1 AND status IN (1, 2) AND ") +
                                       kPrefixFilter +
                                       " AND (object_key > ?3 OR (object_key = ?3 AND unified_id > ?4)) "
                                       "GROUP BY object_key, unified_id ORDER BY object_key, unified_id LIMIT ?5;",
                                   2);

  Statement st(db, sql.c_str());
  BindU64(st.get(), 1, collection_id);
  BindText(st.get(), 2, prefix);
  BindText(st.get(), 3, key_marker);
  sqlite3_bind_int64(st.get(), 4, version_marker == 0 ? std::numeric_limits<sqlite3_int64>::max() : static_cast<sqlite3_int64>(version_marker));
  BindU64(st.get(), 5, limit);

  std::vector<model::VersionRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadVersion(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateSegmentStatus(Transaction& t, uint64_t collection_id, uint64_t unified_id, SegmentStatus from, SegmentStatus to) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE segment SET status=? WHERE collection_id=? AND unified_id=? AND status=?;");
  sqlite3_bind_int(st.get(), 1, static_cast<int>(to));
  BindU64(st.get(), 2, collection_id);
  BindU64(st.get(), 3, unified_id);
  sqlite3_bind_int(st.get(), 4, static_cast<int>(from));

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Conjoined archives
// ------------------------------------------------------------------

Result SqliteRepository::InsertConjoined(Transaction& t, const model::ConjoinedRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO conjoined(collection_id,unified_id,object_key,create_ms,abort_ms,complete_ms) VALUES(?,?,?,?,?,?);");
  BindU64(st.get(), 1, r.collection_id);
  BindU64(st.get(), 2, r.unified_id);
  BindText(st.get(), 3, r.key);
  BindU64(st.get(), 4, r.create_ms);
  BindOptionalU64(st.get(), 5, r.abort_ms);
  BindOptionalU64(st.get(), 6, r.complete_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ConjoinedRecord> SqliteRepository::GetConjoined(Transaction& t, uint64_t collection_id, uint64_t unified_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT collection_id,unified_id,object_key,create_ms,abort_ms,complete_ms FROM conjoined "
               "WHERE collection_id=? AND unified_id=?;");
  BindU64(st.get(), 1, collection_id);
  BindU64(st.get(), 2, unified_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadConjoined(st.get());
}

Result SqliteRepository::UpdateConjoined(Transaction& t, const model::ConjoinedRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE conjoined SET abort_ms=?, complete_ms=? WHERE collection_id=? AND unified_id=?;");
  BindOptionalU64(st.get(), 1, r.abort_ms);
  BindOptionalU64(st.get(), 2, r.complete_ms);
  BindU64(st.get(), 3, r.collection_id);
  BindU64(st.get(), 4, r.unified_id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound);
  }
  return Translate(db, rc);
}

std::vector<model::ConjoinedRecord> SqliteRepository::ListConjoined(Transaction& t, uint64_t collection_id, const std::string& key_marker,
                                                                    uint64_t id_marker, uint32_t limit) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT collection_id,unified_id,object_key,create_ms,abort_ms,complete_ms FROM conjoined "
               "WHERE collection_id=?1 AND unified_id > ?2 AND (?3 = '' OR object_key > ?3) "
               "ORDER BY unified_id LIMIT ?4;");
  BindU64(st.get(), 1, collection_id);
  BindU64(st.get(), 2, id_marker);
  BindText(st.get(), 3, key_marker);
  BindU64(st.get(), 4, limit);

  std::vector<model::ConjoinedRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadConjoined(st.get()));
  }
  return out;
}

} // namespace cirrus::db::sqlite
