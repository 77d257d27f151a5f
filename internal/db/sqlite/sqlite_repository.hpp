#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace cirrus::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // CREATE TABLE IF NOT EXISTS for every table the repository touches.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertCollection(Transaction&, model::CollectionRecord&) override;
  std::optional<model::CollectionRecord> GetCollectionByName(Transaction&, const std::string&) override;

  Result InsertSegment(Transaction&, const model::SegmentRecord&) override;
  std::vector<model::SegmentRecord> GetSegments(Transaction&, uint64_t collection_id, uint64_t unified_id) override;
  std::optional<model::VersionRecord> GetCurrentVersion(Transaction&, uint64_t collection_id, const std::string& key) override;
  std::vector<model::VersionRecord> ListLiveKeys(Transaction&, uint64_t collection_id, const std::string& prefix,
                                                 const std::string& marker, uint32_t limit) override;
  std::vector<model::VersionRecord> ListVersions(Transaction&, uint64_t collection_id, const std::string& prefix,
                                                 const std::string& key_marker, uint64_t version_marker, uint32_t limit) override;
  Result UpdateSegmentStatus(Transaction&, uint64_t collection_id, uint64_t unified_id, model::SegmentStatus from,
                             model::SegmentStatus to) override;

  Result InsertConjoined(Transaction&, const model::ConjoinedRecord&) override;
  std::optional<model::ConjoinedRecord> GetConjoined(Transaction&, uint64_t collection_id, uint64_t unified_id) override;
  Result UpdateConjoined(Transaction&, const model::ConjoinedRecord&) override;
  std::vector<model::ConjoinedRecord> ListConjoined(Transaction&, uint64_t collection_id, const std::string& key_marker,
                                                    uint64_t id_marker, uint32_t limit) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
