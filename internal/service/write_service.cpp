#include "write_service.hpp"

#include <algorithm>

#include "internal/accounting/space_accounting.hpp"
#include "internal/conjoined/conjoined_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/api/throw_if_error.hpp"
#include "internal/ids/id_translator.hpp"
#include "internal/ids/unified_id_factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/segment_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe.hpp"

namespace cirrus::service {

using db::model::ConjoinedState;
using db::model::SegmentStatus;
using observability::IntField;
using observability::StringField;

WriteService::WriteService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void WriteService::DiscardSegments(const std::vector<std::string>& locations) noexcept {
  for (const auto& location : locations) {
    try {
      ctx_.store->Remove(location);
    } catch (const std::exception& ex) {
      CIRRUS_LOG_WARN("segment discard failed", {StringField("location", location), StringField("error", ex.what())});
    }
  }
}

void WriteService::CheckArchiveKey(uint64_t collection_id, const std::string& key, const std::string& conjoined_identifier) {
  const auto record = ctx_.conjoined->Get(collection_id, ctx_.translator->InternalId(conjoined_identifier));
  if (record.key != key) {
    throw util::NotFound("conjoined archive " + conjoined_identifier + " not found for key " + key);
  }
  if (record.State() != ConjoinedState::Active) {
    throw util::Conflict("conjoined archive " + conjoined_identifier + " is " + db::model::ConjoinedStateName(record.State()));
  }
}

bool WriteService::HasPart(db::Transaction& tx, uint64_t collection_id, uint64_t unified_id, uint32_t part) {
  const auto rows = ctx_.repository->GetSegments(tx, collection_id, unified_id);
  return std::any_of(rows.begin(), rows.end(), [part](const db::model::SegmentRecord& row) { return row.conjoined_part == part; });
}

void WriteService::CheckPartUnused(uint64_t collection_id, uint64_t unified_id, uint32_t part, const std::string& conjoined_identifier) {
  auto       tx     = ctx_.repository->Begin();
  const bool exists = HasPart(*tx, collection_id, unified_id, part);
  tx->Commit();
  if (exists) {
    throw util::Conflict("conjoined archive " + conjoined_identifier + " already has part " + std::to_string(part));
  }
}

gateway::v1::ArchiveKeyResponse WriteService::ArchiveKey(uint64_t collection_id, const std::string& key, const std::string& body,
                                                         const ArchiveParams& params) {
  return ObserveRequest("archive_key", *ctx_.faults, [&] {
    if (key.empty()) {
      throw util::ClientSyntaxError("archive: empty key");
    }

    if (params.conjoined_part && !params.conjoined_identifier) {
      throw util::ClientSyntaxError("archive: conjoined_part without conjoined_identifier");
    }

    const bool     conjoined = params.conjoined_identifier.has_value();
    ids::UnifiedId unified_id;
    uint32_t       part = 0;
    if (conjoined) {
      CheckArchiveKey(collection_id, key, *params.conjoined_identifier);
      unified_id = ctx_.translator->InternalId(*params.conjoined_identifier);
      part       = params.conjoined_part.value_or(0);
      CheckPartUnused(collection_id, unified_id, part, *params.conjoined_identifier);
    } else {
      unified_id = ctx_.ids->Next();
    }

    const uint64_t segment_bytes = ctx_.limits.max_segment_bytes == 0 ? body.size() : ctx_.limits.max_segment_bytes;
    const uint64_t now           = util::ToUnixMillis(util::Now());
    const auto     status        = conjoined ? SegmentStatus::Active : SegmentStatus::Final;
    // Conjoined parts share a unified id, so every upload gets its own locations.
    const uint64_t upload_id = conjoined ? ctx_.ids->Next() : 0;

    std::vector<db::model::SegmentRecord> rows;
    std::vector<std::string>              locations;
    uint64_t                              offset = 0;
    uint32_t                              seq    = 0;
    try {
      do {
        const uint64_t length = std::min<uint64_t>(segment_bytes, body.size() - offset);

        storage::SegmentAddress address{collection_id, unified_id, part, seq, upload_id};
        auto location = ctx_.store->Write(address, storage::common::CopyToBuffer(std::string_view(body).substr(offset, length)));
        locations.push_back(location);

        db::model::SegmentRecord row;
        row.collection_id    = collection_id;
        row.key              = key;
        row.unified_id       = unified_id;
        row.conjoined_part   = part;
        row.sequence_no      = seq;
        row.offset           = offset;
        row.size             = length;
        row.timestamp_ms     = now;
        row.storage_location = std::move(location);
        row.status           = status;
        rows.push_back(std::move(row));

        offset += length;
        ++seq;
      } while (offset < body.size());

      auto tx = ctx_.repository->Begin();
      if (conjoined) {
        const auto archive = ctx_.repository->GetConjoined(*tx, collection_id, unified_id);
        if (!archive || archive->State() != ConjoinedState::Active) {
          throw util::Conflict("conjoined archive " + *params.conjoined_identifier + " closed during upload");
        }
        if (HasPart(*tx, collection_id, unified_id, part)) {
          throw util::Conflict("conjoined archive " + *params.conjoined_identifier + " already has part " + std::to_string(part));
        }
      }
      for (const auto& row : rows) {
        db::ThrowIfDbError(ctx_.repository->InsertSegment(*tx, row), "archive " + key);
      }
      tx->Commit();
    } catch (...) {
      DiscardSegments(locations);
      throw;
    }

    try {
      ctx_.accounting->Added(collection_id, now, body.size());
    } catch (const std::exception& ex) {
      CIRRUS_LOG_WARN("archive accounting failed", {StringField("key", key), StringField("error", ex.what())});
    }

    gateway::v1::ArchiveKeyResponse response;
    response.set_version_identifier(ctx_.translator->PublicId(unified_id));
    CIRRUS_LOG_INFO("archive", {StringField("key", key), StringField("version_identifier", response.version_identifier()),
                                IntField("size", static_cast<int64_t>(body.size())), IntField("segments", static_cast<int64_t>(rows.size()))});
    return response;
  });
}

gateway::v1::DeleteKeyResponse WriteService::DeleteKey(uint64_t collection_id, const std::string& key) {
  return ObserveRequest("delete_key", *ctx_.faults, [&] {
    const uint64_t now = util::ToUnixMillis(util::Now());

    auto tx      = ctx_.repository->Begin();
    auto current = ctx_.repository->GetCurrentVersion(*tx, collection_id, key);
    if (!current || current->tombstone) {
      throw util::NotFound("delete: no live version of " + key);
    }

    db::model::SegmentRecord marker;
    marker.collection_id = collection_id;
    marker.key           = key;
    marker.unified_id    = ctx_.ids->Next();
    marker.timestamp_ms  = now;
    marker.status        = SegmentStatus::Tombstone;
    db::ThrowIfDbError(ctx_.repository->InsertSegment(*tx, marker), "delete " + key);
    tx->Commit();

    try {
      ctx_.accounting->Removed(collection_id, now, current->size);
    } catch (const std::exception& ex) {
      CIRRUS_LOG_WARN("delete accounting failed", {StringField("key", key), StringField("error", ex.what())});
    }

    gateway::v1::DeleteKeyResponse response;
    response.set_success(true);
    response.set_version_identifier(ctx_.translator->PublicId(marker.unified_id));
    CIRRUS_LOG_INFO("delete", {StringField("key", key), StringField("version_identifier", response.version_identifier())});
    return response;
  });
}

gateway::v1::ConjoinedResponse WriteService::StartConjoined(uint64_t collection_id, const std::string& key) {
  return ObserveRequest("start_conjoined", *ctx_.faults, [&] {
    if (key.empty()) {
      throw util::ClientSyntaxError("start conjoined: empty key");
    }
    gateway::v1::ConjoinedResponse response;
    response.set_conjoined_identifier(ctx_.conjoined->Start(collection_id, key).conjoined_identifier());
    return response;
  });
}

gateway::v1::ConjoinedResponse WriteService::FinishConjoined(uint64_t collection_id, const std::string& key,
                                                             const std::string& conjoined_identifier) {
  return ObserveRequest("finish_conjoined", *ctx_.faults, [&] {
    CheckArchiveKey(collection_id, key, conjoined_identifier);
    gateway::v1::ConjoinedResponse response;
    response.set_conjoined_identifier(ctx_.conjoined->Finish(collection_id, conjoined_identifier).conjoined_identifier());
    return response;
  });
}

gateway::v1::ConjoinedResponse WriteService::AbortConjoined(uint64_t collection_id, const std::string& key,
                                                            const std::string& conjoined_identifier) {
  return ObserveRequest("abort_conjoined", *ctx_.faults, [&] {
    CheckArchiveKey(collection_id, key, conjoined_identifier);
    gateway::v1::ConjoinedResponse response;
    response.set_conjoined_identifier(ctx_.conjoined->Abort(collection_id, conjoined_identifier).conjoined_identifier());
    return response;
  });
}

} // namespace cirrus::service
