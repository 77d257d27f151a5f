#include "internal/conjoined/conjoined_manager.hpp"

#include <algorithm>
#include <functional>
#include <map>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cirrus::conjoined {

using db::model::ConjoinedRecord;
using db::model::ConjoinedState;
using db::model::SegmentStatus;
using observability::StringField;

ConjoinedManager::ConjoinedManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<ids::UnifiedIdFactory> ids,
                                   std::shared_ptr<ids::IdTranslator> translator, uint32_t max_list_entries)
    : repository_(std::move(repository)),
      ids_(std::move(ids)),
      translator_(std::move(translator)),
      max_list_entries_(max_list_entries == 0 ? 1000 : max_list_entries) {
}

std::mutex& ConjoinedManager::ArchiveMutex(uint64_t collection_id, ids::UnifiedId unified_id) {
  const auto stripe = std::hash<uint64_t>{}(unified_id ^ (collection_id * 0x9E3779B97F4A7C15ULL)) % kArchiveLockStripes;
  return archive_mutexes_[stripe];
}

gateway::v1::ConjoinedEntry ConjoinedManager::ToEntry(const ConjoinedRecord& record) const {
  gateway::v1::ConjoinedEntry entry;
  entry.set_key(record.key);
  entry.set_conjoined_identifier(translator_->PublicId(record.unified_id));
  entry.set_state(db::model::ConjoinedStateName(record.State()));
  entry.set_create_timestamp(util::FormatIsoTimestamp(record.create_ms));
  if (record.abort_ms) entry.set_abort_timestamp(util::FormatIsoTimestamp(*record.abort_ms));
  if (record.complete_ms) entry.set_complete_timestamp(util::FormatIsoTimestamp(*record.complete_ms));
  return entry;
}

gateway::v1::ConjoinedEntry ConjoinedManager::Start(uint64_t collection_id, const std::string& key) {
  ConjoinedRecord record;
  record.unified_id    = ids_->Next();
  record.collection_id = collection_id;
  record.key           = key;
  record.create_ms     = util::ToUnixMillis(util::Now());

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertConjoined(*tx, record), "start conjoined");
  tx->Commit();

  auto entry = ToEntry(record);
  CIRRUS_LOG_INFO("conjoined started", {StringField("key", key), StringField("conjoined_identifier", entry.conjoined_identifier())});
  return entry;
}

gateway::v1::ConjoinedEntry ConjoinedManager::Finish(uint64_t collection_id, const std::string& conjoined_identifier) {
  return Complete(collection_id, conjoined_identifier, Transition::Finish);
}

gateway::v1::ConjoinedEntry ConjoinedManager::Abort(uint64_t collection_id, const std::string& conjoined_identifier) {
  return Complete(collection_id, conjoined_identifier, Transition::Abort);
}

gateway::v1::ConjoinedEntry ConjoinedManager::Complete(uint64_t collection_id, const std::string& conjoined_identifier, Transition transition) {
  const auto unified_id = translator_->InternalId(conjoined_identifier);
  const char* verb      = transition == Transition::Finish ? "finish conjoined" : "abort conjoined";

  std::lock_guard<std::mutex> archive_lock(ArchiveMutex(collection_id, unified_id));

  auto tx     = repository_->Begin();
  auto record = repository_->GetConjoined(*tx, collection_id, unified_id);
  if (!record) {
    throw util::NotFound(std::string(verb) + ": archive " + conjoined_identifier + " not found");
  }
  if (record->State() != ConjoinedState::Active) {
    throw util::Conflict(std::string(verb) + ": archive " + conjoined_identifier + " is already " +
                         db::model::ConjoinedStateName(record->State()));
  }

  const auto now = util::ToUnixMillis(util::Now());
  if (transition == Transition::Finish) {
    record->complete_ms = now;
    db::ThrowIfDbError(repository_->UpdateSegmentStatus(*tx, collection_id, unified_id, SegmentStatus::Active, SegmentStatus::Final), verb);
  } else {
    record->abort_ms = now;
    db::ThrowIfDbError(repository_->UpdateSegmentStatus(*tx, collection_id, unified_id, SegmentStatus::Active, SegmentStatus::Cancelled), verb);
  }
  db::ThrowIfDbError(repository_->UpdateConjoined(*tx, *record), verb);
  tx->Commit();

  CIRRUS_LOG_INFO(verb, {StringField("key", record->key), StringField("conjoined_identifier", conjoined_identifier)});
  return ToEntry(*record);
}

ConjoinedRecord ConjoinedManager::Get(uint64_t collection_id, ids::UnifiedId unified_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetConjoined(*tx, collection_id, unified_id);
  tx->Commit();
  if (!record) {
    throw util::NotFound("conjoined archive " + translator_->PublicId(unified_id) + " not found");
  }
  return *record;
}

gateway::v1::ListConjoinedResponse ConjoinedManager::ListArchives(uint64_t collection_id, uint32_t max_count, const std::string& key_marker,
                                                                  const std::optional<std::string>& conjoined_identifier_marker) {
  const uint32_t limit     = std::clamp<uint32_t>(max_count, 1, max_list_entries_);
  const uint64_t id_marker = conjoined_identifier_marker ? translator_->InternalId(*conjoined_identifier_marker) : 0;

  auto tx      = repository_->Begin();
  auto records = repository_->ListConjoined(*tx, collection_id, key_marker, id_marker, limit + 1);
  tx->Commit();

  gateway::v1::ListConjoinedResponse response;
  response.set_truncated(records.size() > limit);
  if (records.size() > limit) records.resize(limit);

  for (const auto& record : records) {
    *response.add_conjoined_list() = ToEntry(record);
  }
  return response;
}

gateway::v1::ListUploadsResponse ConjoinedManager::ListUploadsInArchive(uint64_t collection_id, const std::string& key,
                                                                        const std::string& conjoined_identifier) {
  const auto unified_id = translator_->InternalId(conjoined_identifier);

  auto tx     = repository_->Begin();
  auto record = repository_->GetConjoined(*tx, collection_id, unified_id);
  if (!record || record->key != key) {
    throw util::NotFound("list uploads: archive " + conjoined_identifier + " not found for key " + key);
  }
  if (record->State() != ConjoinedState::Active) {
    throw util::Conflict("list uploads: archive " + conjoined_identifier + " is " + db::model::ConjoinedStateName(record->State()));
  }
  auto segments = repository_->GetSegments(*tx, collection_id, unified_id);
  tx->Commit();

  std::map<uint32_t, gateway::v1::UploadEntry> parts;
  std::map<uint32_t, uint64_t>                 newest;
  for (const auto& segment : segments) {
    if (segment.status != SegmentStatus::Active) continue;

    auto& part = parts[segment.conjoined_part];
    part.set_conjoined_part(segment.conjoined_part);
    part.set_file_size(part.file_size() + segment.size);
    part.set_segment_count(part.segment_count() + 1);
    newest[segment.conjoined_part] = std::max(newest[segment.conjoined_part], segment.timestamp_ms);
  }

  gateway::v1::ListUploadsResponse response;
  response.set_conjoined_identifier(conjoined_identifier);
  for (auto& [number, part] : parts) {
    part.set_timestamp(util::FormatIsoTimestamp(newest[number]));
    *response.add_upload_list() = std::move(part);
  }
  response.set_truncated(false);
  return response;
}

} // namespace cirrus::conjoined
