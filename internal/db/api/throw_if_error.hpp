#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace cirrus::db {

// Converts a failed repository Result into the gateway exception taxonomy.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::Conflict:
      throw util::Conflict(message);
    case ErrorCode::Busy:
      throw util::DependencyUnavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace cirrus::db
