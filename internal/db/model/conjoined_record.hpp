#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cirrus::db::model {

enum class ConjoinedState {
  Active,
  Completed,
  Aborted,
};

/*
  Persistent conjoined (multi-part) archive row.

  State is derived from the timestamps: neither set while Active, exactly
  one set once terminal.
*/
struct ConjoinedRecord {
  uint64_t    unified_id    = 0;
  uint64_t    collection_id = 0;
  std::string key;
  uint64_t    create_ms = 0;

  std::optional<uint64_t> abort_ms;
  std::optional<uint64_t> complete_ms;

  ConjoinedState State() const {
    if (complete_ms) return ConjoinedState::Completed;
    if (abort_ms) return ConjoinedState::Aborted;
    return ConjoinedState::Active;
  }
};

inline const char* ConjoinedStateName(ConjoinedState state) {
  switch (state) {
    case ConjoinedState::Active:
      return "active";
    case ConjoinedState::Completed:
      return "completed";
    case ConjoinedState::Aborted:
      return "aborted";
  }
  return "unknown";
}

} // namespace cirrus::db::model
