#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "cirrus/gateway/v1.hpp"
#include "internal/retrieval/retrieval_engine.hpp"
#include "service_context.hpp"

namespace cirrus::service {

struct ListKeysParams {
  std::string                prefix;
  std::optional<uint32_t>    max_keys;
  std::string                marker;
  std::string                delimiter;
};

struct ListVersionsParams {
  std::string                prefix;
  std::optional<uint32_t>    max_versions;
  std::string                key_marker;
  std::optional<std::string> version_identifier_marker;
};

struct ListConjoinedParams {
  std::optional<uint32_t>    max_conjoined;
  std::string                key_marker;
  std::optional<std::string> conjoined_identifier_marker;
};

/*
  Operations behind the read service endpoints. Collections are resolved
  and authorized by the caller.
*/
class ReadService {
public:
  explicit ReadService(ServiceContext ctx);

  retrieval::RetrievalResult Retrieve(const retrieval::RetrievalRequest& req);
  gateway::v1::ObjectMetadata Metadata(uint64_t collection_id, const std::string& key, const std::optional<std::string>& version_identifier);

  gateway::v1::ListKeysResponse ListKeys(uint64_t collection_id, const ListKeysParams& params);
  gateway::v1::ListVersionsResponse ListVersions(uint64_t collection_id, const ListVersionsParams& params);
  gateway::v1::ListConjoinedResponse ListConjoined(uint64_t collection_id, const ListConjoinedParams& params);
  gateway::v1::ListUploadsResponse ListUploads(uint64_t collection_id, const std::string& key, const std::string& conjoined_identifier);

  gateway::v1::SpaceUsageResponse SpaceUsage(uint64_t collection_id, const std::string& collection_name);

private:
  uint32_t Limit(const std::optional<uint32_t>& requested) const;

  ServiceContext ctx_;
};

}
