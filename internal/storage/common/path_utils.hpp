#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace cirrus::storage::common {

inline void ValidateLocation(const std::string& location) {
  if (location.empty()) {
    throw util::StorageError("storage location must not be empty");
  }
  for (char c : location) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::StorageError("storage location contains invalid character");
    }
  }
  if (location == "." || location == "..") {
    throw util::StorageError("storage location must not be a relative path component");
  }
}

inline std::filesystem::path SegmentPath(const std::filesystem::path& root, const std::string& location) {
  ValidateLocation(location);
  return root / (location + ".seg");
}

} // namespace cirrus::storage::common
