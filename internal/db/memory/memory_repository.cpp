#include "memory_repository.hpp"

#include <algorithm>
#include <limits>
#include <tuple>

#include "memory_tx.hpp"

namespace cirrus::db::memory {

using model::SegmentStatus;

namespace {

bool HasPrefix(const std::string& key, const std::string& prefix) {
  return key.compare(0, prefix.size(), prefix) == 0;
}

bool Visible(SegmentStatus status) {
  return status == SegmentStatus::Final || status == SegmentStatus::Tombstone;
}

// Final/Tombstone versions of one key, ordered by unified id.
std::map<uint64_t, model::VersionRecord> Versions(const std::string& key, const std::vector<model::SegmentRecord>& rows) {
  std::map<uint64_t, model::VersionRecord> versions;
  for (const auto& row : rows) {
    if (!Visible(row.status)) continue;

    auto& version      = versions[row.unified_id];
    version.key        = key;
    version.unified_id = row.unified_id;
    version.tombstone  = version.tombstone || row.status == SegmentStatus::Tombstone;
    version.timestamp_ms = std::max(version.timestamp_ms, row.timestamp_ms);
    version.size += row.size;
  }
  return versions;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertCollection(Transaction& t, model::CollectionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.collection_names.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "collection " + r.name + " exists");

  r.id = s.next_collection_id++;
  s.collections[r.id]         = r;
  s.collection_names[r.name] = r.id;
  return Result::Ok();
}

std::optional<model::CollectionRecord> MemoryRepository::GetCollectionByName(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  const auto  it = s.collection_names.find(name);
  if (it == s.collection_names.end()) return std::nullopt;
  return s.collections.at(it->second);
}

Result MemoryRepository::InsertSegment(Transaction& t, const model::SegmentRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.collections.contains(r.collection_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown collection");

  const IdIndex id_index{r.collection_id, r.unified_id};
  const auto    owner = s.segment_keys.find(id_index);
  if (owner != s.segment_keys.end() && owner->second != r.key) {
    return Result::Err(ErrorCode::ConstraintViolation, "unified id already belongs to another key");
  }

  auto& rows = s.segments[{r.collection_id, r.key}];
  for (const auto& existing : rows) {
    if (existing.unified_id == r.unified_id && existing.conjoined_part == r.conjoined_part && existing.sequence_no == r.sequence_no) {
      return Result::Err(ErrorCode::AlreadyExists, "segment exists");
    }
  }
  rows.push_back(r);
  s.segment_keys[id_index] = r.key;
  return Result::Ok();
}

std::vector<model::SegmentRecord> MemoryRepository::GetSegments(Transaction& t, uint64_t collection_id, uint64_t unified_id) {
  const auto& s     = TX(t).View();
  const auto  owner = s.segment_keys.find({collection_id, unified_id});
  if (owner == s.segment_keys.end()) return {};

  std::vector<model::SegmentRecord> out;
  for (const auto& row : s.segments.at({collection_id, owner->second})) {
    if (row.unified_id == unified_id) out.push_back(row);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.conjoined_part, a.sequence_no) < std::tie(b.conjoined_part, b.sequence_no);
  });
  return out;
}

std::optional<model::VersionRecord> MemoryRepository::GetCurrentVersion(Transaction& t, uint64_t collection_id, const std::string& key) {
  const auto& s  = TX(t).View();
  const auto  it = s.segments.find({collection_id, key});
  if (it == s.segments.end()) return std::nullopt;

  auto versions = Versions(key, it->second);
  if (versions.empty()) return std::nullopt;
  return versions.rbegin()->second;
}

std::vector<model::VersionRecord> MemoryRepository::ListLiveKeys(Transaction& t, uint64_t collection_id, const std::string& prefix,
                                                                 const std::string& marker, uint32_t limit) {
  const auto&                       s = TX(t).View();
  std::vector<model::VersionRecord> out;

  for (auto it = s.segments.lower_bound({collection_id, std::max(prefix, marker)});
       it != s.segments.end() && it->first.first == collection_id && out.size() < limit; ++it) {
    const auto& key = it->first.second;
    if (key <= marker) continue;
    if (!HasPrefix(key, prefix)) break;

    auto versions = Versions(key, it->second);
    if (versions.empty() || versions.rbegin()->second.tombstone) continue;
    out.push_back(versions.rbegin()->second);
  }
  return out;
}

std::vector<model::VersionRecord> MemoryRepository::ListVersions(Transaction& t, uint64_t collection_id, const std::string& prefix,
                                                                 const std::string& key_marker, uint64_t version_marker, uint32_t limit) {
  const auto&                       s = TX(t).View();
  std::vector<model::VersionRecord> out;
  const uint64_t effective_marker = version_marker == 0 ? std::numeric_limits<uint64_t>::max() : version_marker;

  for (auto it = s.segments.lower_bound({collection_id, std::max(prefix, key_marker)});
       it != s.segments.end() && it->first.first == collection_id && out.size() < limit; ++it) {
    const auto& key = it->first.second;
    if (key < key_marker) continue;
    if (!HasPrefix(key, prefix)) break;

    for (const auto& [unified_id, version] : Versions(key, it->second)) {
      if (key == key_marker && unified_id <= effective_marker) continue;
      if (out.size() >= limit) break;
      out.push_back(version);
    }
  }
  return out;
}

Result MemoryRepository::UpdateSegmentStatus(Transaction& t, uint64_t collection_id, uint64_t unified_id, SegmentStatus from, SegmentStatus to) {
  auto&      s     = TX(t).Mutable();
  const auto owner = s.segment_keys.find({collection_id, unified_id});
  if (owner == s.segment_keys.end()) return Result::Ok();

  for (auto& row : s.segments[{collection_id, owner->second}]) {
    if (row.unified_id == unified_id && row.status == from) row.status = to;
  }
  return Result::Ok();
}

Result MemoryRepository::InsertConjoined(Transaction& t, const model::ConjoinedRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.collections.contains(r.collection_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown collection");
  if (s.conjoined.contains({r.collection_id, r.unified_id})) return Result::Err(ErrorCode::AlreadyExists, "conjoined archive exists");
  s.conjoined[{r.collection_id, r.unified_id}] = r;
  return Result::Ok();
}

std::optional<model::ConjoinedRecord> MemoryRepository::GetConjoined(Transaction& t, uint64_t collection_id, uint64_t unified_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.conjoined.find({collection_id, unified_id});
  if (it == s.conjoined.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateConjoined(Transaction& t, const model::ConjoinedRecord& r) {
  auto&      s  = TX(t).Mutable();
  const auto it = s.conjoined.find({r.collection_id, r.unified_id});
  if (it == s.conjoined.end()) return Result::Err(ErrorCode::NotFound);
  it->second = r;
  return Result::Ok();
}

std::vector<model::ConjoinedRecord> MemoryRepository::ListConjoined(Transaction& t, uint64_t collection_id, const std::string& key_marker,
                                                                    uint64_t id_marker, uint32_t limit) {
  const auto&                         s = TX(t).View();
  std::vector<model::ConjoinedRecord> out;

  for (auto it = s.conjoined.upper_bound({collection_id, id_marker});
       it != s.conjoined.end() && it->first.first == collection_id && out.size() < limit; ++it) {
    if (!key_marker.empty() && it->second.key <= key_marker) continue;
    out.push_back(it->second);
  }
  return out;
}

} // namespace cirrus::db::memory
