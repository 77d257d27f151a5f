#pragma once

#include <cstdint>
#include <string>

namespace cirrus::db::model {

enum class SegmentStatus {
  Active    = 0, // part of a conjoined archive that is still open
  Final     = 1,
  Tombstone = 2, // delete marker, carries no bytes
  Cancelled = 3, // part of an aborted conjoined archive
};

/*
  Status row for one stored segment of an object version.

  Segments of one version are ordered by (conjoined_part, sequence_no).
  Inside a part, offsets start at zero and are contiguous.
*/
struct SegmentRecord {
  uint64_t    collection_id  = 0;
  std::string key;
  uint64_t    unified_id     = 0;
  uint32_t    conjoined_part = 0;
  uint32_t    sequence_no    = 0;
  uint64_t    offset         = 0;
  uint64_t    size           = 0;
  uint64_t    timestamp_ms   = 0;
  std::string storage_location;

  SegmentStatus status = SegmentStatus::Final;
};

} // namespace cirrus::db::model
