#pragma once

#include <memory>

#include "segment_store.hpp"
#include "config/config.pb.h"

namespace cirrus::storage {

/*
  Builds the segment store from configuration.

      auto store = StorageFactory::Build(config.storage());
      store->Write(address, buffer);
*/

class StorageFactory {
public:
  static SegmentStorePtr Build(const cirrus::runtime::config::StorageConfig& cfg);
};

} // namespace cirrus::storage
