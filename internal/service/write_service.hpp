#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "cirrus/gateway/v1.hpp"
#include "internal/db/api/transaction.hpp"
#include "service_context.hpp"

namespace cirrus::service {

struct ArchiveParams {
  std::optional<std::string> conjoined_identifier;
  std::optional<uint32_t>    conjoined_part;
};

/*
  Operations behind the write service endpoints.

  Segment bytes are stored before their status rows are inserted. When the
  insert fails the stored segments are removed again, so a failed archive
  never leaves a visible version behind.
*/
class WriteService {
public:
  explicit WriteService(ServiceContext ctx);

  gateway::v1::ArchiveKeyResponse ArchiveKey(uint64_t collection_id, const std::string& key, const std::string& body,
                                             const ArchiveParams& params);
  gateway::v1::DeleteKeyResponse DeleteKey(uint64_t collection_id, const std::string& key);

  gateway::v1::ConjoinedResponse StartConjoined(uint64_t collection_id, const std::string& key);
  gateway::v1::ConjoinedResponse FinishConjoined(uint64_t collection_id, const std::string& key, const std::string& conjoined_identifier);
  gateway::v1::ConjoinedResponse AbortConjoined(uint64_t collection_id, const std::string& key, const std::string& conjoined_identifier);

private:
  void DiscardSegments(const std::vector<std::string>& locations) noexcept;
  void CheckArchiveKey(uint64_t collection_id, const std::string& key, const std::string& conjoined_identifier);
  bool HasPart(db::Transaction& tx, uint64_t collection_id, uint64_t unified_id, uint32_t part);
  // Rejects a repeated part before any bytes reach the segment store.
  void CheckPartUnused(uint64_t collection_id, uint64_t unified_id, uint32_t part, const std::string& conjoined_identifier);

  ServiceContext ctx_;
};

}
