#include "internal/accounting/bounded_space_accounting.hpp"

#include "internal/util/deadline.hpp"

namespace cirrus::accounting {

BoundedSpaceAccounting::BoundedSpaceAccounting(SpaceAccountingPtr inner, std::chrono::milliseconds ceiling)
    : inner_(std::move(inner)), ceiling_(ceiling) {
}

void BoundedSpaceAccounting::Added(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) {
  util::CallWithDeadline(ceiling_, "accounting added",
                         [inner = inner_, collection_id, timestamp_ms, bytes] { inner->Added(collection_id, timestamp_ms, bytes); });
}

void BoundedSpaceAccounting::Removed(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) {
  util::CallWithDeadline(ceiling_, "accounting removed",
                         [inner = inner_, collection_id, timestamp_ms, bytes] { inner->Removed(collection_id, timestamp_ms, bytes); });
}

void BoundedSpaceAccounting::Retrieved(uint64_t collection_id, uint64_t timestamp_ms, uint64_t bytes) {
  util::CallWithDeadline(ceiling_, "accounting retrieved",
                         [inner = inner_, collection_id, timestamp_ms, bytes] { inner->Retrieved(collection_id, timestamp_ms, bytes); });
}

std::vector<DailyUsage> BoundedSpaceAccounting::Usage(uint64_t collection_id) {
  return util::CallWithDeadline(ceiling_, "accounting usage", [inner = inner_, collection_id] { return inner->Usage(collection_id); });
}

} // namespace cirrus::accounting
