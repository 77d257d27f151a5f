#include "pg_repository.hpp"

#include <limits>

namespace cirrus::db::postgres {

using model::SegmentStatus;

namespace {

// Unified ids and sizes fit in BIGINT; they are stored signed.
int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::optional<int64_t> I64(const std::optional<uint64_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

uint64_t U64(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

std::optional<uint64_t> OptionalU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return U64(f);
}

model::VersionRecord ReadVersion(const pqxx::row& row) {
  model::VersionRecord r;
  r.key          = row[0].c_str();
  r.unified_id   = U64(row[1]);
  r.tombstone    = row[2].as<bool>();
  r.timestamp_ms = U64(row[3]);
  r.size         = U64(row[4]);
  return r;
}

model::ConjoinedRecord ReadConjoined(const pqxx::row& row) {
  model::ConjoinedRecord r;
  r.collection_id = U64(row[0]);
  r.unified_id    = U64(row[1]);
  r.key           = row[2].c_str();
  r.create_ms     = U64(row[3]);
  r.abort_ms      = OptionalU64(row[4]);
  r.complete_ms   = OptionalU64(row[5]);
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);
  tx.exec(
      "CREATE TABLE IF NOT EXISTS collection (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL UNIQUE, access_control TEXT NOT NULL, "
      "password_sha256 TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS segment (collection_id BIGINT NOT NULL REFERENCES collection(id), object_key TEXT COLLATE \"C\" NOT NULL, "
      "unified_id BIGINT NOT NULL, conjoined_part INTEGER NOT NULL, sequence_no INTEGER NOT NULL, segment_offset BIGINT NOT NULL, "
      "size BIGINT NOT NULL, timestamp_ms BIGINT NOT NULL, storage_location TEXT NOT NULL, status SMALLINT NOT NULL, "
      "PRIMARY KEY (collection_id, unified_id, conjoined_part, sequence_no));");
  tx.exec("CREATE INDEX IF NOT EXISTS segment_key_idx ON segment (collection_id, object_key, unified_id);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS conjoined (collection_id BIGINT NOT NULL REFERENCES collection(id), unified_id BIGINT NOT NULL, "
      "object_key TEXT COLLATE \"C\" NOT NULL, create_ms BIGINT NOT NULL, abort_ms BIGINT, complete_ms BIGINT, "
      "PRIMARY KEY (collection_id, unified_id));");
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertCollection(Transaction& t, model::CollectionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_collection", r.name, r.access_control, r.password_sha256, I64(r.created_at_ms));
    r.id     = U64(res[0][0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CollectionRecord> PgRepository::GetCollectionByName(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_prepared("get_collection", name);
  if (res.empty()) return std::nullopt;

  model::CollectionRecord r;
  r.id              = U64(res[0][0]);
  r.name            = res[0][1].c_str();
  r.access_control  = res[0][2].c_str();
  r.password_sha256 = res[0][3].c_str();
  r.created_at_ms   = U64(res[0][4]);
  return r;
}

Result PgRepository::InsertSegment(Transaction& t, const model::SegmentRecord& r) {
  try {
    auto& work  = TX(t).Work();
    auto  owner = work.exec_prepared("segment_owner", I64(r.collection_id), I64(r.unified_id));
    if (!owner.empty() && owner[0][0].c_str() != r.key) {
      return Result::Err(ErrorCode::ConstraintViolation, "unified id already belongs to another key");
    }
    work.exec_prepared("insert_segment", I64(r.collection_id), r.key, I64(r.unified_id), static_cast<int>(r.conjoined_part),
                       static_cast<int>(r.sequence_no), I64(r.offset), I64(r.size), I64(r.timestamp_ms), r.storage_location,
                       static_cast<int>(r.status));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SegmentRecord> PgRepository::GetSegments(Transaction& t, uint64_t collection_id, uint64_t unified_id) {
  auto res = TX(t).Work().exec_prepared("get_segments", I64(collection_id), I64(unified_id));

  std::vector<model::SegmentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::SegmentRecord r;
    r.collection_id    = U64(row[0]);
    r.key              = row[1].c_str();
    r.unified_id       = U64(row[2]);
    r.conjoined_part   = static_cast<uint32_t>(row[3].as<int>());
    r.sequence_no      = static_cast<uint32_t>(row[4].as<int>());
    r.offset           = U64(row[5]);
    r.size             = U64(row[6]);
    r.timestamp_ms     = U64(row[7]);
    r.storage_location = row[8].c_str();
    r.status           = static_cast<SegmentStatus>(row[9].as<int>());
    out.push_back(std::move(r));
  }
  return out;
}

std::optional<model::VersionRecord> PgRepository::GetCurrentVersion(Transaction& t, uint64_t collection_id, const std::string& key) {
  auto res = TX(t).Work().exec_params(
      "SELECT object_key, unified_id, bool_or(status = 2), MAX(timestamp_ms), SUM(size)::BIGINT FROM segment "
      "WHERE collection_id=$1 AND object_key=$2 AND status IN (1, 2) "
      "GROUP BY object_key, unified_id ORDER BY unified_id DESC LIMIT 1;",
      I64(collection_id), key);
  if (res.empty()) return std::nullopt;
  return ReadVersion(res[0]);
}

std::vector<model::VersionRecord> PgRepository::ListLiveKeys(Transaction& t, uint64_t collection_id, const std::string& prefix,
                                                             const std::string& marker, uint32_t limit) {
  auto res = TX(t).Work().exec_params(
      "SELECT s.object_key, s.unified_id, false, MAX(s.timestamp_ms), SUM(s.size)::BIGINT FROM segment s "
      "WHERE s.collection_id=$1 AND s.status=1 AND s.object_key > $2 AND left(s.object_key, length($3)) = $3 "
      "AND s.unified_id = (SELECT MAX(c.unified_id) FROM segment c WHERE c.collection_id=s.collection_id "
      "AND c.object_key=s.object_key AND c.status IN (1, 2)) "
      "GROUP BY s.object_key, s.unified_id ORDER BY s.object_key LIMIT $4;",
      I64(collection_id), marker, prefix, static_cast<int64_t>(limit));

  std::vector<model::VersionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadVersion(row));
  }
  return out;
}

std::vector<model::VersionRecord> PgRepository::ListVersions(Transaction& t, uint64_t collection_id, const std::string& prefix,
                                                             const std::string& key_marker, uint64_t version_marker, uint32_t limit) {
  const int64_t effective_marker = version_marker == 0 ? std::numeric_limits<int64_t>::max() : I64(version_marker);

  auto res = TX(t).Work().exec_params(
      "SELECT object_key, unified_id, bool_or(status = 2), MAX(timestamp_ms), SUM(size)::BIGINT FROM segment "
      "WHERE collection_id=$1 AND status IN (1, 2) AND left(object_key, length($2)) = $2 "
      "AND (object_key > $3 OR (object_key = $3 AND unified_id > $4)) "
      "GROUP BY object_key, unified_id ORDER BY object_key, unified_id LIMIT $5;",
      I64(collection_id), prefix, key_marker, effective_marker, static_cast<int64_t>(limit));

  std::vector<model::VersionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadVersion(row));
  }
  return out;
}

Result PgRepository::UpdateSegmentStatus(Transaction& t, uint64_t collection_id, uint64_t unified_id, SegmentStatus from, SegmentStatus to) {
  try {
    TX(t).Work().exec_prepared("update_segment_status", I64(collection_id), I64(unified_id), static_cast<int>(from), static_cast<int>(to));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertConjoined(Transaction& t, const model::ConjoinedRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_conjoined", I64(r.collection_id), I64(r.unified_id), r.key, I64(r.create_ms), I64(r.abort_ms),
                               I64(r.complete_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ConjoinedRecord> PgRepository::GetConjoined(Transaction& t, uint64_t collection_id, uint64_t unified_id) {
  auto res = TX(t).Work().exec_prepared("get_conjoined", I64(collection_id), I64(unified_id));
  if (res.empty()) return std::nullopt;
  return ReadConjoined(res[0]);
}

Result PgRepository::UpdateConjoined(Transaction& t, const model::ConjoinedRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_conjoined", I64(r.collection_id), I64(r.unified_id), I64(r.abort_ms), I64(r.complete_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ConjoinedRecord> PgRepository::ListConjoined(Transaction& t, uint64_t collection_id, const std::string& key_marker,
                                                                uint64_t id_marker, uint32_t limit) {
  auto res = TX(t).Work().exec_params(
      "SELECT collection_id,unified_id,object_key,create_ms,abort_ms,complete_ms FROM conjoined "
      "WHERE collection_id=$1 AND unified_id > $2 AND ($3 = '' OR object_key > $3) "
      "ORDER BY unified_id LIMIT $4;",
      I64(collection_id), I64(id_marker), key_marker, static_cast<int64_t>(limit));

  std::vector<model::ConjoinedRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadConjoined(row));
  }
  return out;
}

} // namespace cirrus::db::postgres
