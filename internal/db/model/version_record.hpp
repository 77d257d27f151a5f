#pragma once

#include <cstdint>
#include <string>

namespace cirrus::db::model {

/*
  One object version aggregated from its Final or Tombstone segment rows.
*/
struct VersionRecord {
  std::string key;
  uint64_t    unified_id   = 0;
  bool        tombstone    = false;
  uint64_t    timestamp_ms = 0; // newest segment
  uint64_t    size         = 0; // sum of segment sizes
};

} // namespace cirrus::db::model
