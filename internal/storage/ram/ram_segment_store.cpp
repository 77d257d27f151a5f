#include "ram_segment_store.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace cirrus::storage {

std::string RamSegmentStore::Write(const SegmentAddress& address, const std::shared_ptr<arrow::Buffer>& bytes) {
  auto location = SegmentLocation(address);

  std::unique_lock lock(mutex_);
  buffers_[location] = bytes;
  return location;
}

/*
  Zero-copy slice read.
*/
std::shared_ptr<arrow::Buffer> RamSegmentStore::Read(const std::string& location, uint64_t offset, uint64_t length) {
  std::shared_ptr<arrow::Buffer> buffer;
  {
    std::shared_lock lock(mutex_);
    auto it = buffers_.find(location);
    if (it == buffers_.end()) throw util::StorageError("segment " + location + " not found");
    buffer = it->second;
  }

  const auto size = static_cast<uint64_t>(buffer->size());
  if (offset > size || length > size - offset) {
    throw util::StorageError("read past end of segment " + location);
  }
  return arrow::SliceBuffer(buffer, static_cast<int64_t>(offset), static_cast<int64_t>(length));
}

void RamSegmentStore::Remove(const std::string& location) {
  std::unique_lock lock(mutex_);
  buffers_.erase(location);
}

std::size_t RamSegmentStore::SegmentCount() const {
  std::shared_lock lock(mutex_);
  return buffers_.size();
}

} // namespace cirrus::storage
