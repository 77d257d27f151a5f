#pragma once

#include <map>
#include <mutex>
#include <utility>

#include "internal/accounting/space_accounting.hpp"

namespace cirrus::accounting {

class MemorySpaceAccounting final : public SpaceAccounting {
 public:
  void Added(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) override;
  void Removed(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) override;
  void Retrieved(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) override;

  std::vector<DailyUsage> Usage(uint64_t collection_id) override;

 private:
  DailyUsage& Day(uint64_t collection_id, uint64_t timestamp_ms);

  std::mutex mutex_;
  // (collection id, day) -> counters; the day string sorts chronologically
  std::map<std::pair<uint64_t, std::string>, DailyUsage> days_;
};

} // namespace cirrus::accounting
