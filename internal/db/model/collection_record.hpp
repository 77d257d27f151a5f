#pragma once

#include <cstdint>
#include <string>

namespace cirrus::db::model {

/*
  Persistent collection row. Read-only to the gateway core.
*/
struct CollectionRecord {
  uint64_t id = 0; // assigned on insert

  std::string name;

  // AccessControl policy as JSON text (see internal/access/access_policy.hpp)
  std::string access_control;

  // hex SHA-256 of the collection password; empty when none is set
  std::string password_sha256;

  uint64_t created_at_ms = 0;
};

} // namespace cirrus::db::model
