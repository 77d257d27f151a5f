#pragma once

#include <filesystem>
#include <arrow/buffer.h>

#include "internal/storage/segment_store.hpp"

namespace cirrus::storage {

/*
  Durable disk segment store using Arrow IO.

  Properties:
    - atomic replace writes
    - optional fsync
    - positional reads, never the whole file
*/

class DiskSegmentStore final : public SegmentStore {
public:
  DiskSegmentStore(std::filesystem::path root, bool fsync);

  std::string Write(const SegmentAddress& address,
                    const std::shared_ptr<arrow::Buffer>& bytes) override;

  std::shared_ptr<arrow::Buffer>
  Read(const std::string& location, uint64_t offset, uint64_t length) override;

  void Remove(const std::string& location) override;

private:
  std::filesystem::path root_;
  bool fsync_;
};

}
