#include "internal/retrieval/retrieval_engine.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/retrieval/content_type.hpp"
#include "internal/retrieval/range_spec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cirrus::retrieval {

using db::model::SegmentRecord;
using db::model::SegmentStatus;

namespace {

int64_t ParseConditionalDate(const std::string& header_name, const std::string& value) {
  const auto seconds = util::ParseHttpDate(value);
  if (!seconds) {
    throw util::ClientSyntaxError("invalid " + header_name + " header '" + value + "'");
  }
  return *seconds;
}

// Inside each conjoined part offsets start at zero and are contiguous.
void CheckContiguous(const std::string& key, const std::vector<SegmentRecord>& segments) {
  std::map<uint32_t, uint64_t> next_offset;
  for (const auto& segment : segments) {
    auto& expected = next_offset[segment.conjoined_part];
    if (segment.offset != expected) {
      throw std::runtime_error("segment gap in " + key + " part " + std::to_string(segment.conjoined_part) + " at offset " +
                               std::to_string(expected));
    }
    expected += segment.size;
  }
}

} // namespace

RetrievalEngine::RetrievalEngine(std::shared_ptr<db::Repository> repository, storage::SegmentStorePtr store,
                                 std::shared_ptr<ids::IdTranslator> translator, observability::FaultReporterPtr faults, uint64_t chunk_bytes)
    : repository_(std::move(repository)),
      store_(std::move(store)),
      translator_(std::move(translator)),
      faults_(std::move(faults)),
      chunk_bytes_(chunk_bytes) {
}

RetrievalResult RetrievalEngine::Retrieve(const RetrievalRequest& request) {
  try {
    return RetrieveResolved(request);
  } catch (const util::GatewayError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::InternalError(observability::ReportFault(*faults_, "retrieval", e));
  }
}

ObjectMetadata RetrievalEngine::Describe(uint64_t collection_id, const std::string& key, const std::optional<std::string>& version_identifier) {
  try {
    return Resolve(collection_id, key, version_identifier).metadata;
  } catch (const util::GatewayError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::InternalError(observability::ReportFault(*faults_, "retrieval", e));
  }
}

RetrievalEngine::ResolvedVersion RetrievalEngine::Resolve(uint64_t collection_id, const std::string& key,
                                                          const std::optional<std::string>& version_identifier) {
  auto tx = repository_->Begin();

  uint64_t unified_id = 0;
  if (version_identifier) {
    unified_id = translator_->InternalId(*version_identifier);
  } else {
    const auto current = repository_->GetCurrentVersion(*tx, collection_id, key);
    if (!current || current->tombstone) {
      throw util::NotFound("key " + key + " not found");
    }
    unified_id = current->unified_id;
  }

  ResolvedVersion resolved;
  for (auto& segment : repository_->GetSegments(*tx, collection_id, unified_id)) {
    if (segment.key != key) break;
    if (segment.status == SegmentStatus::Tombstone) {
      throw util::NotFound("version of " + key + " is a delete marker");
    }
    if (segment.status == SegmentStatus::Final) {
      resolved.segments.push_back(std::move(segment));
    }
  }
  tx->Commit();

  // size and modification time come from the same rows; no rows means neither
  if (resolved.segments.empty()) {
    throw util::NotFound("version of " + key + " not found");
  }
  CheckContiguous(key, resolved.segments);

  auto& metadata              = resolved.metadata;
  metadata.key                = key;
  metadata.unified_id         = unified_id;
  metadata.version_identifier = translator_->PublicId(unified_id);
  metadata.content_type       = GuessContentType(key);
  metadata.segment_count      = static_cast<uint32_t>(resolved.segments.size());
  for (const auto& segment : resolved.segments) {
    metadata.total_size += segment.size;
    metadata.last_modified_ms = std::max(metadata.last_modified_ms, segment.timestamp_ms);
  }
  return resolved;
}

RetrievalResult RetrievalEngine::RetrieveResolved(const RetrievalRequest& request) {
  auto resolved = Resolve(request.collection_id, request.key, request.version_identifier);

  RetrievalResult result;
  result.metadata = resolved.metadata;

  const auto total_size = result.metadata.total_size;

  std::optional<RangeSpec> range;
  if (request.range && !request.headers_only) {
    range = ParseRange(*request.range);
  }

  // HTTP dates carry whole seconds
  const auto last_modified_s = static_cast<int64_t>(result.metadata.last_modified_ms / 1000);
  if (request.if_modified_since) {
    if (last_modified_s < ParseConditionalDate("If-Modified-Since", *request.if_modified_since)) {
      result.status = RetrievalStatus::NotModified;
      return result;
    }
  }
  if (request.if_unmodified_since) {
    if (last_modified_s > ParseConditionalDate("If-Unmodified-Since", *request.if_unmodified_since)) {
      result.status = RetrievalStatus::PreconditionFailed;
      return result;
    }
  }

  uint64_t begin = 0;
  uint64_t end   = total_size;
  if (range && total_size > 0) {
    if (range->offset >= total_size) {
      throw util::ClientSyntaxError("range start " + std::to_string(range->offset) + " beyond object size " + std::to_string(total_size));
    }
    begin = range->offset;
    if (range->last && *range->last < total_size - 1) {
      end = *range->last + 1;
    }
    result.status        = RetrievalStatus::Partial;
    result.content_range = "bytes " + std::to_string(begin) + "-" + std::to_string(end - 1) + "/" + std::to_string(total_size);
  }
  result.content_length = end - begin;

  if (request.headers_only) {
    return result;
  }

  std::vector<SegmentSlice> slices;
  uint64_t                  position = 0;
  for (const auto& segment : resolved.segments) {
    const auto segment_begin = position;
    const auto segment_end   = position + segment.size;
    position                 = segment_end;

    const auto from = std::max(begin, segment_begin);
    const auto to   = std::min(end, segment_end);
    if (from >= to) continue;

    slices.push_back({segment.storage_location, from - segment_begin, to - from});
  }

  CIRRUS_LOG_INFO("retrieve", {observability::StringField("key", request.key),
                               observability::StringField("version", result.metadata.version_identifier),
                               observability::IntField("offset", static_cast<int64_t>(begin)),
                               observability::IntField("length", static_cast<int64_t>(result.content_length))});

  result.body = std::make_unique<SegmentByteStream>(store_, std::move(slices), chunk_bytes_, faults_);
  return result;
}

} // namespace cirrus::retrieval
