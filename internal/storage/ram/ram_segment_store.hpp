#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>

#include <arrow/buffer.h>

#include "internal/storage/segment_store.hpp"

namespace cirrus::storage {

/*
  RAM segment store.

  Backed by Arrow buffers stored in-memory.
  Reads return zero-copy slices.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamSegmentStore final : public SegmentStore {
public:
  RamSegmentStore() = default;
  ~RamSegmentStore() override = default;

  std::string Write(const SegmentAddress& address,
                    const std::shared_ptr<arrow::Buffer>& bytes) override;

  std::shared_ptr<arrow::Buffer>
  Read(const std::string& location, uint64_t offset, uint64_t length) override;

  void Remove(const std::string& location) override;

  std::size_t SegmentCount() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace cirrus::storage
