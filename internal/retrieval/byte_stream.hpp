#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/observability/fault_reporter.hpp"
#include "internal/storage/segment_store.hpp"

namespace cirrus::retrieval {

/*
  Finite, single-pass, pull-based sequence of byte chunks.

  Next() materializes at most one chunk and returns nullptr once the
  sequence is exhausted or cancelled. Not restartable. Cancel() stops any
  further fetch from storage.
*/
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  virtual std::shared_ptr<arrow::Buffer> Next() = 0;
  virtual void                           Cancel() = 0;

  // Bytes not yet handed out.
  virtual uint64_t Remaining() const = 0;
};

// A contiguous piece of one stored segment.
struct SegmentSlice {
  std::string location;
  uint64_t    offset = 0;
  uint64_t    length = 0;
};

/*
  Streams an ordered list of slices in chunks of at most chunk_bytes. A
  chunk may span slice boundaries; only the pieces needed for the chunk
  being produced are read.
*/
class SegmentByteStream final : public ByteStream {
 public:
  SegmentByteStream(storage::SegmentStorePtr store, std::vector<SegmentSlice> slices, uint64_t chunk_bytes,
                    observability::FaultReporterPtr faults);

  std::shared_ptr<arrow::Buffer> Next() override;
  void                           Cancel() override;
  uint64_t                       Remaining() const override;

 private:
  std::shared_ptr<arrow::Buffer> Fetch(uint64_t want);

  storage::SegmentStorePtr        store_;
  std::vector<SegmentSlice>       slices_;
  uint64_t                        chunk_bytes_;
  observability::FaultReporterPtr faults_;

  std::size_t slice_index_  = 0;
  uint64_t    slice_cursor_ = 0; // consumed bytes of slices_[slice_index_]
  uint64_t    remaining_    = 0;
  bool        cancelled_    = false;
};

} // namespace cirrus::retrieval
