#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/collection_record.hpp"
#include "internal/db/model/conjoined_record.hpp"
#include "internal/db/model/segment_record.hpp"
#include "internal/db/model/version_record.hpp"

namespace cirrus::db {

/*
  Repository abstraction over the cluster metadata database.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Segment status flips for one unified id are atomic

  The DB is the source of truth for:
    collections and their access control
    segment status rows (object versions)
    conjoined archives
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Collections
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertCollection(Transaction&, model::CollectionRecord& record) = 0;

  virtual std::optional<model::CollectionRecord> GetCollectionByName(Transaction&, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Segments
  // ---------------------------------------------------------------------

  virtual Result InsertSegment(Transaction&, const model::SegmentRecord& record) = 0;

  // All rows of one unified id, any status, ordered by (conjoined_part, sequence_no).
  virtual std::vector<model::SegmentRecord> GetSegments(Transaction&, uint64_t collection_id, uint64_t unified_id) = 0;

  // Newest Final or Tombstone version of a key.
  virtual std::optional<model::VersionRecord> GetCurrentVersion(Transaction&, uint64_t collection_id, const std::string& key) = 0;

  // Keys whose current version is not a tombstone, key > marker, ordered by key.
  virtual std::vector<model::VersionRecord> ListLiveKeys(Transaction&, uint64_t collection_id, const std::string& prefix,
                                                         const std::string& marker, uint32_t limit) = 0;

  // Final and Tombstone versions ordered by (key, unified_id), strictly after
  // (key_marker, version_marker). version_marker 0 skips key_marker entirely.
  virtual std::vector<model::VersionRecord> ListVersions(Transaction&, uint64_t collection_id, const std::string& prefix,
                                                         const std::string& key_marker, uint64_t version_marker, uint32_t limit) = 0;

  // Moves every row of unified_id currently in `from` to `to`.
  virtual Result UpdateSegmentStatus(Transaction&, uint64_t collection_id, uint64_t unified_id, model::SegmentStatus from,
                                     model::SegmentStatus to) = 0;

  // ---------------------------------------------------------------------
  // Conjoined archives
  // ---------------------------------------------------------------------

  virtual Result InsertConjoined(Transaction&, const model::ConjoinedRecord& record) = 0;

  virtual std::optional<model::ConjoinedRecord> GetConjoined(Transaction&, uint64_t collection_id, uint64_t unified_id) = 0;

  virtual Result UpdateConjoined(Transaction&, const model::ConjoinedRecord& record) = 0;

  // Ordered by unified_id; both markers are exclusive lower bounds, empty/0 = unset.
  virtual std::vector<model::ConjoinedRecord> ListConjoined(Transaction&, uint64_t collection_id, const std::string& key_marker,
                                                            uint64_t id_marker, uint32_t limit) = 0;
};

} // namespace cirrus::db
