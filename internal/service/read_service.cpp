#include "read_service.hpp"

#include <algorithm>

#include "internal/accounting/space_accounting.hpp"
#include "internal/conjoined/conjoined_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ids/id_translator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retrieval/retrieval_engine.hpp"
#include "internal/util/time.hpp"
#include "observe.hpp"

namespace cirrus::service {

using observability::IntField;
using observability::StringField;

namespace {

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

ReadService::ReadService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

uint32_t ReadService::Limit(const std::optional<uint32_t>& requested) const {
  const uint32_t cap = ctx_.limits.max_list_entries == 0 ? 1000 : ctx_.limits.max_list_entries;
  if (!requested) return cap;
  return std::clamp<uint32_t>(*requested, 1, cap);
}

retrieval::RetrievalResult ReadService::Retrieve(const retrieval::RetrievalRequest& req) {
  return ObserveRequest("retrieve", *ctx_.faults, [&] {
    auto result = ctx_.retrieval->Retrieve(req);

    const bool streams = result.body != nullptr;
    if (streams && result.content_length > 0) {
      try {
        ctx_.accounting->Retrieved(req.collection_id, util::ToUnixMillis(util::Now()), result.content_length);
      } catch (const std::exception& ex) {
        CIRRUS_LOG_WARN("retrieval accounting failed", {StringField("key", req.key), StringField("error", ex.what())});
      }
    }
    return result;
  });
}

gateway::v1::ObjectMetadata ReadService::Metadata(uint64_t collection_id, const std::string& key,
                                                  const std::optional<std::string>& version_identifier) {
  return ObserveRequest("metadata", *ctx_.faults, [&] {
    const auto described = ctx_.retrieval->Describe(collection_id, key, version_identifier);

    gateway::v1::ObjectMetadata meta;
    meta.set_key(described.key);
    meta.set_version_identifier(described.version_identifier);
    meta.set_timestamp(util::FormatIsoTimestamp(described.last_modified_ms));
    meta.set_file_size(described.total_size);
    meta.set_content_type(described.content_type);
    meta.set_segment_count(described.segment_count);
    return meta;
  });
}

gateway::v1::ListKeysResponse ReadService::ListKeys(uint64_t collection_id, const ListKeysParams& params) {
  return ObserveRequest("list_keys", *ctx_.faults, [&] {
    const uint32_t limit = Limit(params.max_keys);

    gateway::v1::ListKeysResponse response;
    uint32_t                      emitted = 0;
    std::string                   marker  = params.marker;
    std::string                   last_prefix;

    // A marker that is itself a collapsed prefix hides everything under it.
    if (!params.delimiter.empty() && StartsWith(marker, params.prefix) && marker.size() >= params.delimiter.size() &&
        marker.compare(marker.size() - params.delimiter.size(), params.delimiter.size(), params.delimiter) == 0) {
      last_prefix = marker;
    }

    bool done = false;
    while (!done) {
      auto tx   = ctx_.repository->Begin();
      auto rows = ctx_.repository->ListLiveKeys(*tx, collection_id, params.prefix, marker, limit + 1);
      tx->Commit();

      for (const auto& row : rows) {
        marker = row.key;

        if (!params.delimiter.empty()) {
          const auto pos = row.key.find(params.delimiter, params.prefix.size());
          if (pos != std::string::npos) {
            auto common = row.key.substr(0, pos + params.delimiter.size());
            if (!last_prefix.empty() && common == last_prefix) continue;
            if (emitted == limit) {
              response.set_truncated(true);
              done = true;
              break;
            }
            response.add_prefixes(common);
            last_prefix = std::move(common);
            ++emitted;
            continue;
          }
        }

        if (emitted == limit) {
          response.set_truncated(true);
          done = true;
          break;
        }
        auto* entry = response.add_key_data();
        entry->set_key(row.key);
        entry->set_version_identifier(ctx_.translator->PublicId(row.unified_id));
        entry->set_timestamp(util::FormatIsoTimestamp(row.timestamp_ms));
        entry->set_file_size(row.size);
        ++emitted;
      }

      if (rows.size() <= limit) done = true;
    }

    CIRRUS_LOG_INFO("list keys", {StringField("prefix", params.prefix), IntField("entries", emitted), observability::BoolField("truncated", response.truncated())});
    return response;
  });
}

gateway::v1::ListVersionsResponse ReadService::ListVersions(uint64_t collection_id, const ListVersionsParams& params) {
  return ObserveRequest("list_versions", *ctx_.faults, [&] {
    const uint32_t limit          = Limit(params.max_versions);
    const uint64_t version_marker = params.version_identifier_marker ? ctx_.translator->InternalId(*params.version_identifier_marker) : 0;

    auto tx   = ctx_.repository->Begin();
    auto rows = ctx_.repository->ListVersions(*tx, collection_id, params.prefix, params.key_marker, version_marker, limit + 1);
    tx->Commit();

    gateway::v1::ListVersionsResponse response;
    response.set_truncated(rows.size() > limit);
    if (rows.size() > limit) rows.resize(limit);

    for (const auto& row : rows) {
      auto* entry = response.add_version_data();
      entry->set_key(row.key);
      entry->set_version_identifier(ctx_.translator->PublicId(row.unified_id));
      entry->set_timestamp(util::FormatIsoTimestamp(row.timestamp_ms));
      entry->set_file_size(row.size);
      entry->set_delete_marker(row.tombstone);
    }
    return response;
  });
}

gateway::v1::ListConjoinedResponse ReadService::ListConjoined(uint64_t collection_id, const ListConjoinedParams& params) {
  return ObserveRequest("list_conjoined", *ctx_.faults, [&] {
    return ctx_.conjoined->ListArchives(collection_id, Limit(params.max_conjoined), params.key_marker, params.conjoined_identifier_marker);
  });
}

gateway::v1::ListUploadsResponse ReadService::ListUploads(uint64_t collection_id, const std::string& key, const std::string& conjoined_identifier) {
  return ObserveRequest("list_uploads", *ctx_.faults, [&] {
    return ctx_.conjoined->ListUploadsInArchive(collection_id, key, conjoined_identifier);
  });
}

gateway::v1::SpaceUsageResponse ReadService::SpaceUsage(uint64_t collection_id, const std::string& collection_name) {
  return ObserveRequest("space_usage", *ctx_.faults, [&] {
    gateway::v1::SpaceUsageResponse response;
    response.set_collection(collection_name);
    for (const auto& day : ctx_.accounting->Usage(collection_id)) {
      auto* entry = response.add_usage();
      entry->set_day(day.day);
      entry->set_bytes_added(day.bytes_added);
      entry->set_bytes_removed(day.bytes_removed);
      entry->set_bytes_retrieved(day.bytes_retrieved);
    }
    return response;
  });
}

} // namespace cirrus::service
