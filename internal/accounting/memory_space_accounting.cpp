#include "internal/accounting/memory_space_accounting.hpp"

#include "internal/util/time.hpp"

namespace cirrus::accounting {

DailyUsage& MemorySpaceAccounting::Day(uint64_t collection_id, uint64_t timestamp_ms) {
  auto  day   = util::FormatDay(timestamp_ms);
  auto& usage = days_[{collection_id, day}];
  usage.day   = std::move(day);
  return usage;
}

void MemorySpaceAccounting::Added(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  Day(collection_id, timestamp_ms).bytes_added += bytes;
}

void MemorySpaceAccounting::Removed(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  Day(collection_id, timestamp_ms).bytes_removed += bytes;
}

void MemorySpaceAccounting::Retrieved(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  Day(collection_id, timestamp_ms).bytes_retrieved += bytes;
}

std::vector<DailyUsage> MemorySpaceAccounting::Usage(uint64_t collection_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<DailyUsage> out;
  for (auto it = days_.lower_bound({collection_id, std::string()}); it != days_.end() && it->first.first == collection_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

} // namespace cirrus::accounting
