#pragma once

#include <cstdint>
#include <memory>

namespace cirrus::db { class Repository; }
namespace cirrus::storage { class SegmentStore; }
namespace cirrus::ids { class UnifiedIdFactory; class IdTranslator; }
namespace cirrus::retrieval { class RetrievalEngine; }
namespace cirrus::conjoined { class ConjoinedManager; }
namespace cirrus::accounting { class SpaceAccounting; }
namespace cirrus::access { class Authenticator; }
namespace cirrus::observability { class FaultReporter; }

namespace cirrus::service {

struct ServiceLimits {
  uint64_t max_segment_bytes  = 10 * 1024 * 1024;
  uint32_t max_list_entries   = 1000;
  uint64_t max_body_bytes     = 1024ULL * 1024 * 1024;
  uint64_t stream_chunk_bytes = 1024 * 1024;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<cirrus::db::Repository> repository;
  std::shared_ptr<cirrus::storage::SegmentStore> store;
  std::shared_ptr<cirrus::ids::UnifiedIdFactory> ids;
  std::shared_ptr<cirrus::ids::IdTranslator> translator;
  std::shared_ptr<cirrus::retrieval::RetrievalEngine> retrieval;
  std::shared_ptr<cirrus::conjoined::ConjoinedManager> conjoined;
  std::shared_ptr<cirrus::accounting::SpaceAccounting> accounting;
  std::shared_ptr<cirrus::access::Authenticator> authenticator;
  std::shared_ptr<cirrus::observability::FaultReporter> faults;
  ServiceLimits limits;
};

}
