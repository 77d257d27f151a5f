#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cirrus::accounting {

struct DailyUsage {
  std::string day; // YYYY-MM-DD, UTC
  uint64_t    bytes_added     = 0;
  uint64_t    bytes_removed   = 0;
  uint64_t    bytes_retrieved = 0;
};

/*
  Per-collection byte counters. Implementations that talk to a remote
  accounting service raise util::DependencyUnavailable when the service
  does not answer within the dependency timeout.
*/
class SpaceAccounting {
 public:
  virtual ~SpaceAccounting() = default;

  virtual void Added(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes)     = 0;
  virtual void Removed(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes)   = 0;
  virtual void Retrieved(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) = 0;

  // Oldest day first.
  virtual std::vector<DailyUsage> Usage(uint64_t collection_id) = 0;
};

using SpaceAccountingPtr = std::shared_ptr<SpaceAccounting>;

} // namespace cirrus::accounting
