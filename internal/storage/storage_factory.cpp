#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_segment_store.hpp"
#include "ram/ram_segment_store.hpp"

namespace cirrus::storage {

SegmentStorePtr StorageFactory::Build(const cirrus::runtime::config::StorageConfig& cfg) {
  if (cfg.has_disk()) {
    std::filesystem::path root =
        cfg.disk().root_path().empty() ? std::filesystem::path{"/tmp/cirrus"} : std::filesystem::path{cfg.disk().root_path()};
    return std::make_shared<DiskSegmentStore>(std::move(root), cfg.disk().fsync());
  }
  return std::make_shared<RamSegmentStore>();
}

} // namespace cirrus::storage
