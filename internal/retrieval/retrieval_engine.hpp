#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/ids/id_translator.hpp"
#include "internal/observability/fault_reporter.hpp"
#include "internal/retrieval/byte_stream.hpp"
#include "internal/storage/segment_store.hpp"

namespace cirrus::retrieval {

enum class RetrievalStatus {
  Ok,                 // 200
  Partial,            // 206
  NotModified,        // 304
  PreconditionFailed, // 412
};

struct RetrievalRequest {
  uint64_t    collection_id = 0;
  std::string key;

  std::optional<std::string> version_identifier; // public id
  std::optional<std::string> range;
  std::optional<std::string> if_modified_since;
  std::optional<std::string> if_unmodified_since;

  // HEAD: no body and no range handling.
  bool headers_only = false;
};

struct ObjectMetadata {
  std::string key;
  uint64_t    unified_id = 0;
  std::string version_identifier;
  uint64_t    last_modified_ms = 0;
  uint64_t    total_size       = 0;
  std::string content_type;
  uint32_t    segment_count = 0;
};

struct RetrievalResult {
  RetrievalStatus status = RetrievalStatus::Ok;
  ObjectMetadata  metadata;

  uint64_t                   content_length = 0;
  std::optional<std::string> content_range; // "bytes L-U/total" for Partial

  // Set for Ok and Partial unless headers_only.
  std::unique_ptr<ByteStream> body;
};

/*
  Reconstructs stored objects from their segment rows.

  Version resolution happens first: a missing key or version is NotFound no
  matter which range or conditional headers came with the request. Segment
  fetch failures surface as util::StorageError. Every failure that is not a
  classified gateway error is handed to the fault reporter and rethrown as
  util::InternalError.
*/
class RetrievalEngine {
 public:
  RetrievalEngine(std::shared_ptr<db::Repository> repository, storage::SegmentStorePtr store, std::shared_ptr<ids::IdTranslator> translator,
                  observability::FaultReporterPtr faults, uint64_t chunk_bytes);

  RetrievalResult Retrieve(const RetrievalRequest& request);

  ObjectMetadata Describe(uint64_t collection_id, const std::string& key, const std::optional<std::string>& version_identifier);

 private:
  struct ResolvedVersion {
    ObjectMetadata                    metadata;
    std::vector<db::model::SegmentRecord> segments;
  };

  ResolvedVersion Resolve(uint64_t collection_id, const std::string& key, const std::optional<std::string>& version_identifier);
  RetrievalResult RetrieveResolved(const RetrievalRequest& request);

  std::shared_ptr<db::Repository>    repository_;
  storage::SegmentStorePtr           store_;
  std::shared_ptr<ids::IdTranslator> translator_;
  observability::FaultReporterPtr    faults_;
  uint64_t                           chunk_bytes_;
};

} // namespace cirrus::retrieval
