#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace cirrus::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  using KeyIndex = std::pair<uint64_t, std::string>; // (collection_id, key)
  using IdIndex  = std::pair<uint64_t, uint64_t>;    // (collection_id, unified_id)

  struct State {
    std::map<uint64_t, model::CollectionRecord> collections;
    std::unordered_map<std::string, uint64_t>   collection_names;
    uint64_t                                    next_collection_id = 1;

    std::map<KeyIndex, std::vector<model::SegmentRecord>> segments;
    std::map<IdIndex, std::string>                        segment_keys;

    std::map<IdIndex, model::ConjoinedRecord> conjoined;
  };

  // Held for the lifetime of every transaction; writers are serialized.
  std::mutex tx_mutex_;
  State      committed_;
};

}
