#include "internal/retrieval/byte_stream.hpp"

#include <arrow/buffer.h>

#include <algorithm>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace cirrus::retrieval {

SegmentByteStream::SegmentByteStream(storage::SegmentStorePtr store, std::vector<SegmentSlice> slices, uint64_t chunk_bytes,
                                     observability::FaultReporterPtr faults)
    : store_(std::move(store)), slices_(std::move(slices)), chunk_bytes_(chunk_bytes == 0 ? 1 : chunk_bytes), faults_(std::move(faults)) {
  for (const auto& slice : slices_) {
    remaining_ += slice.length;
  }
}

std::shared_ptr<arrow::Buffer> SegmentByteStream::Next() {
  if (cancelled_ || remaining_ == 0) {
    return nullptr;
  }

  try {
    return Fetch(std::min(chunk_bytes_, remaining_));
  } catch (const util::GatewayError&) {
    cancelled_ = true;
    throw;
  } catch (const std::exception& e) {
    cancelled_ = true;
    throw util::InternalError(observability::ReportFault(*faults_, "retrieval.stream", e));
  }
}

std::shared_ptr<arrow::Buffer> SegmentByteStream::Fetch(uint64_t want) {
  std::vector<std::shared_ptr<arrow::Buffer>> pieces;

  while (want > 0) {
    const auto& slice = slices_[slice_index_];
    const auto  take  = std::min(want, slice.length - slice_cursor_);

    auto piece = store_->Read(slice.location, slice.offset + slice_cursor_, take);
    if (static_cast<uint64_t>(piece->size()) != take) {
      throw util::StorageError("short read from segment " + slice.location);
    }
    pieces.push_back(std::move(piece));

    want -= take;
    remaining_ -= take;
    slice_cursor_ += take;
    if (slice_cursor_ == slice.length) {
      ++slice_index_;
      slice_cursor_ = 0;
    }
  }

  if (pieces.size() == 1) {
    return pieces.front();
  }
  return storage::common::Unwrap(arrow::ConcatenateBuffers(pieces));
}

void SegmentByteStream::Cancel() {
  cancelled_ = true;
}

uint64_t SegmentByteStream::Remaining() const {
  return cancelled_ ? 0 : remaining_;
}

} // namespace cirrus::retrieval
