#include "unified_id_factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace cirrus::ids {

UnifiedIdFactory::UnifiedIdFactory(uint32_t shard_id) : shard_id_(shard_id) {
  if (shard_id_ > kMaxShardId) {
    throw std::invalid_argument("shard id " + std::to_string(shard_id) + " does not fit in " + std::to_string(kShardBits) + " bits");
  }
}

UnifiedId UnifiedIdFactory::Next() {
  std::lock_guard<std::mutex> lock(mutex_);

  uint64_t now_ms = util::ToUnixMillis(util::Now()) - kEpochMs;

  // A clock step backwards keeps issuing from the last observed millisecond.
  if (now_ms <= last_ms_) {
    now_ms = last_ms_;
    if (sequence_ == kMaxSequence) {
      // sequence exhausted: borrow the next millisecond
      ++now_ms;
      sequence_ = 0;
    } else {
      ++sequence_;
    }
  } else {
    sequence_ = 0;
  }
  last_ms_ = now_ms;

  return (now_ms << (kShardBits + kSequenceBits)) | (static_cast<uint64_t>(shard_id_) << kSequenceBits) | sequence_;
}

uint64_t UnifiedIdFactory::TimestampMs(UnifiedId id) {
  return (id >> (kShardBits + kSequenceBits)) + kEpochMs;
}

uint32_t UnifiedIdFactory::ShardOf(UnifiedId id) {
  return static_cast<uint32_t>((id >> kSequenceBits) & kMaxShardId);
}

} // namespace cirrus::ids
