#include "disk_segment_store.hpp"

#include <arrow/io/file.h>
#include <filesystem>
#include <system_error>

#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace cirrus::storage {

using namespace cirrus::storage::common;

DiskSegmentStore::DiskSegmentStore(std::filesystem::path root, bool fsync)
    : root_(std::move(root)), fsync_(fsync) {

  std::filesystem::create_directories(root_);
}

/*
  Atomic write:
      write tmp -> flush -> rename
*/
std::string DiskSegmentStore::Write(const SegmentAddress& address,
                                    const std::shared_ptr<arrow::Buffer>& bytes) {

  auto location = SegmentLocation(address);
  auto final_path = SegmentPath(root_, location);
  auto tmp_path = final_path.string() + ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(bytes->data(), bytes->size()));

    if (fsync_)
      Unwrap(out->Flush());

    Unwrap(out->Close());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) throw util::StorageError("rename " + tmp_path + ": " + ec.message());

  return location;
}

/*
  Positional read of one slice.
*/
std::shared_ptr<arrow::Buffer>
DiskSegmentStore::Read(const std::string& location, uint64_t offset, uint64_t length) {

  auto path = SegmentPath(root_, location);

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  const auto size = static_cast<uint64_t>(Unwrap(file->GetSize()));
  if (offset > size || length > size - offset) {
    throw util::StorageError("read past end of segment " + location);
  }

  auto buffer = Unwrap(file->ReadAt(static_cast<int64_t>(offset), static_cast<int64_t>(length)));
  Unwrap(file->Close());
  return buffer;
}

void DiskSegmentStore::Remove(const std::string& location) {
  std::error_code ec;
  std::filesystem::remove(SegmentPath(root_, location), ec);
  if (ec) throw util::StorageError("remove " + location + ": " + ec.message());
}

}
