#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "cirrus/gateway/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ids/id_translator.hpp"
#include "internal/ids/unified_id_factory.hpp"

namespace cirrus::conjoined {

/*
  Multi-part upload lifecycle.

    Active -> Completed   (Finish: segment rows Active -> Final)
    Active -> Aborted     (Abort:  segment rows Active -> Cancelled)

  Terminal states absorb: a second Finish or Abort is util::Conflict.
  Transitions of one archive are serialized by a striped mutex and applied
  in one repository transaction, so concurrent callers see exactly one
  success. Everything returned to callers carries public identifiers.
*/
class ConjoinedManager {
 public:
  static constexpr std::size_t kArchiveLockStripes = 64;

  ConjoinedManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<ids::UnifiedIdFactory> ids,
                   std::shared_ptr<ids::IdTranslator> translator, uint32_t max_list_entries);

  gateway::v1::ConjoinedEntry Start(uint64_t collection_id, const std::string& key);
  gateway::v1::ConjoinedEntry Finish(uint64_t collection_id, const std::string& conjoined_identifier);
  gateway::v1::ConjoinedEntry Abort(uint64_t collection_id, const std::string& conjoined_identifier);

  // Throws util::NotFound for unknown archives.
  db::model::ConjoinedRecord Get(uint64_t collection_id, ids::UnifiedId unified_id);

  // Ascending by unified id; both markers are exclusive. All states listed.
  gateway::v1::ListConjoinedResponse ListArchives(uint64_t collection_id, uint32_t max_count, const std::string& key_marker,
                                                  const std::optional<std::string>& conjoined_identifier_marker);

  // Parts uploaded so far to one Active archive, ordered by part number.
  gateway::v1::ListUploadsResponse ListUploadsInArchive(uint64_t collection_id, const std::string& key,
                                                        const std::string& conjoined_identifier);

 private:
  enum class Transition { Finish, Abort };

  gateway::v1::ConjoinedEntry        Complete(uint64_t collection_id, const std::string& conjoined_identifier, Transition transition);
  gateway::v1::ConjoinedEntry        ToEntry(const db::model::ConjoinedRecord& record) const;
  std::mutex&                        ArchiveMutex(uint64_t collection_id, ids::UnifiedId unified_id);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<ids::UnifiedIdFactory> ids_;
  std::shared_ptr<ids::IdTranslator>     translator_;
  uint32_t                               max_list_entries_;

  // archives sharing a stripe serialize with each other, which is harmless
  std::array<std::mutex, kArchiveLockStripes> archive_mutexes_;
};

} // namespace cirrus::conjoined
