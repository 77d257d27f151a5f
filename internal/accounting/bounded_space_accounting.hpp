#pragma once

#include <chrono>

#include "internal/accounting/space_accounting.hpp"

namespace cirrus::accounting {

// Wraps another SpaceAccounting so that no call waits longer than the
// dependency timeout ceiling. Late answers raise util::DependencyUnavailable.
class BoundedSpaceAccounting final : public SpaceAccounting {
 public:
  BoundedSpaceAccounting(SpaceAccountingPtr inner, std::chrono::milliseconds ceiling);

  void Added(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) override;
  void Removed(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) override;
  void Retrieved(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) override;

  std::vector<DailyUsage> Usage(uint64_t collection_id) override;

 private:
  SpaceAccountingPtr        inner_;
  std::chrono::milliseconds ceiling_;
};

} // namespace cirrus::accounting
