#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <cstring>
#include <memory>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace cirrus::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageError
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::StorageError(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StorageError(status.ToString());
}

/*
  Copy request bytes into an Arrow-owned buffer
*/
inline std::shared_ptr<arrow::Buffer> CopyToBuffer(std::string_view bytes) {
  auto buffer = Unwrap(arrow::AllocateBuffer(static_cast<int64_t>(bytes.size())));
  if (!bytes.empty()) {
    std::memcpy(buffer->mutable_data(), bytes.data(), bytes.size());
  }
  return std::shared_ptr<arrow::Buffer>(std::move(buffer));
}

} // namespace cirrus::storage::common
