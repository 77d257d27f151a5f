#include "segment_store.hpp"

namespace cirrus::storage {

std::string SegmentLocation(const SegmentAddress& address) {
  auto location = std::to_string(address.collection_id) + "-" + std::to_string(address.unified_id) + "-" +
                  std::to_string(address.conjoined_part) + "-" + std::to_string(address.sequence_no);
  if (address.upload_id != 0) {
    location += "-" + std::to_string(address.upload_id);
  }
  return location;
}

} // namespace cirrus::storage
