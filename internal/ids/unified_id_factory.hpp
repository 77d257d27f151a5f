#pragma once

#include <cstdint>
#include <mutex>

namespace cirrus::ids {

using UnifiedId = uint64_t;

/*
  Issues cluster-wide ordered 64-bit identifiers.

  Layout (most significant first):
    41 bits  milliseconds since 2010-01-01T00:00:00Z
    10 bits  shard (node) id
    12 bits  per-millisecond sequence

  Identifiers from one factory are strictly increasing. Distinct shard ids
  keep factories on different nodes collision-free.
*/
class UnifiedIdFactory {
 public:
  static constexpr uint64_t kEpochMs       = 1262304000000ULL;
  static constexpr uint32_t kShardBits     = 10;
  static constexpr uint32_t kSequenceBits  = 12;
  static constexpr uint32_t kMaxShardId    = (1u << kShardBits) - 1;
  static constexpr uint32_t kMaxSequence   = (1u << kSequenceBits) - 1;

  explicit UnifiedIdFactory(uint32_t shard_id);

  UnifiedId Next();

  uint32_t ShardId() const {
    return shard_id_;
  }

  static uint64_t TimestampMs(UnifiedId id);
  static uint32_t ShardOf(UnifiedId id);

 private:
  uint32_t   shard_id_;
  std::mutex mutex_;
  uint64_t   last_ms_  = 0;
  uint32_t   sequence_ = 0;
};

} // namespace cirrus::ids
