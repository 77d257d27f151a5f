#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

namespace cirrus::storage {

struct SegmentAddress {
  uint64_t collection_id  = 0;
  uint64_t unified_id     = 0;
  uint32_t conjoined_part = 0;
  uint32_t sequence_no    = 0;
  // Distinguishes repeated uploads of the same part; 0 when unused.
  uint64_t upload_id = 0;
};

/*
  Byte storage for object segments.

  Every segment is represented as an Arrow Buffer. The gateway never
  manipulates raw pointers, only buffers.

  Implementations:
    RAM   -> in-memory Arrow buffers
    DISK  -> Arrow file IO

  All failures surface as util::StorageError.
*/
class SegmentStore {
 public:
  virtual ~SegmentStore() = default;

  // Persists one segment and returns the opaque storage location recorded in
  // the segment status row.
  virtual std::string Write(const SegmentAddress& address, const std::shared_ptr<arrow::Buffer>& bytes) = 0;

  // Reads [offset, offset + length) of a stored segment. Reading past the end
  // is a StorageError.
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& location, uint64_t offset, uint64_t length) = 0;

  // Used to discard segments whose status row never committed.
  virtual void Remove(const std::string& location) = 0;
};

using SegmentStorePtr = std::shared_ptr<SegmentStore>;

// "<collection>-<unified id>-<part>-<sequence>[-<upload id>]"
std::string SegmentLocation(const SegmentAddress& address);

} // namespace cirrus::storage
