#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/memory/memory_tx.hpp"

#if CIRRUS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if CIRRUS_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using cirrus::db::ErrorCode;
using cirrus::db::Repository;
using cirrus::db::memory::MemoryRepository;
using cirrus::db::model::CollectionRecord;
using cirrus::db::model::ConjoinedRecord;
using cirrus::db::model::ConjoinedState;
using cirrus::db::model::SegmentRecord;
using cirrus::db::model::SegmentStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

uint64_t CreateCollection(Repository& repo, const std::string& name) {
  auto             tx = repo.Begin();
  CollectionRecord collection{.name = name, .access_control = R"({"password":{"required":true}})", .password_sha256 = "ab", .created_at_ms = NowMs()};
  assert(repo.InsertCollection(*tx, collection));
  tx->Commit();
  assert(collection.id != 0);
  return collection.id;
}

SegmentRecord Row(uint64_t collection_id, const std::string& key, uint64_t unified_id, uint32_t seq, uint64_t offset, uint64_t size,
                  SegmentStatus status = SegmentStatus::Final) {
  return SegmentRecord{.collection_id    = collection_id,
                       .key              = key,
                       .unified_id       = unified_id,
                       .conjoined_part   = 0,
                       .sequence_no      = seq,
                       .offset           = offset,
                       .size             = size,
                       .timestamp_ms     = 1700000000000ULL + unified_id,
                       .storage_location = key + "-" + std::to_string(unified_id) + "-" + std::to_string(seq),
                       .status           = status};
}

void Insert(Repository& repo, const std::vector<SegmentRecord>& rows) {
  auto tx = repo.Begin();
  for (const auto& row : rows) {
    assert(repo.InsertSegment(*tx, row));
  }
  tx->Commit();
}

void VerifyCollections(Repository& repo, const std::string& name) {
  const auto id = CreateCollection(repo, name);

  auto tx    = repo.Begin();
  auto found = repo.GetCollectionByName(*tx, name);
  assert(found.has_value());
  assert(found->id == id);
  assert(found->access_control == R"({"password":{"required":true}})");
  assert(found->password_sha256 == "ab");
  assert(!repo.GetCollectionByName(*tx, name + "-absent").has_value());

  CollectionRecord duplicate{.name = name, .access_control = "{}"};
  const auto       result = repo.InsertCollection(*tx, duplicate);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyVersionsAndTombstones(Repository& repo, uint64_t collection_id) {
  Insert(repo, {Row(collection_id, "doc", 10, 0, 0, 4), Row(collection_id, "doc", 10, 1, 4, 6)});
  Insert(repo, {Row(collection_id, "doc", 20, 0, 0, 3)});

  auto tx      = repo.Begin();
  auto current = repo.GetCurrentVersion(*tx, collection_id, "doc");
  assert(current.has_value());
  assert(current->unified_id == 20);
  assert(current->size == 3);
  assert(!current->tombstone);

  auto segments = repo.GetSegments(*tx, collection_id, 10);
  assert(segments.size() == 2);
  assert(segments[0].sequence_no == 0);
  assert(segments[1].offset == 4);
  assert(segments[1].storage_location == "doc-10-1");
  tx->Commit();

  Insert(repo, {Row(collection_id, "doc", 30, 0, 0, 0, SegmentStatus::Tombstone)});

  tx      = repo.Begin();
  current = repo.GetCurrentVersion(*tx, collection_id, "doc");
  assert(current.has_value());
  assert(current->tombstone);
  assert(!repo.GetCurrentVersion(*tx, collection_id, "nothing").has_value());

  const auto versions = repo.ListVersions(*tx, collection_id, "doc", "", 0, 10);
  assert(versions.size() == 3);
  assert(versions[0].unified_id == 10);
  assert(versions[0].size == 10);
  assert(versions[2].tombstone);

  const auto after_first = repo.ListVersions(*tx, collection_id, "doc", "doc", 10, 10);
  assert(after_first.size() == 2);
  assert(after_first[0].unified_id == 20);
  tx->Commit();
}

void VerifyUnifiedIdOwnership(Repository& repo, uint64_t collection_id) {
  Insert(repo, {Row(collection_id, "owner", 40, 0, 0, 1)});

  auto       tx      = repo.Begin();
  const auto foreign = repo.InsertSegment(*tx, Row(collection_id, "thief", 40, 1, 1, 1));
  assert(!foreign);
  assert(foreign.code == ErrorCode::ConstraintViolation);

  const auto duplicate = repo.InsertSegment(*tx, Row(collection_id, "owner", 40, 0, 0, 1));
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyListLiveKeys(Repository& repo, uint64_t collection_id) {
  Insert(repo, {Row(collection_id, "live/a", 50, 0, 0, 1)});
  Insert(repo, {Row(collection_id, "live/b", 51, 0, 0, 2)});
  Insert(repo, {Row(collection_id, "live/c", 52, 0, 0, 3)});
  Insert(repo, {Row(collection_id, "live/c", 53, 0, 0, 0, SegmentStatus::Tombstone)});
  Insert(repo, {Row(collection_id, "live/d", 54, 0, 0, 4, SegmentStatus::Active)});
  Insert(repo, {Row(collection_id, "livery", 55, 0, 0, 5)});

  auto tx   = repo.Begin();
  auto keys = repo.ListLiveKeys(*tx, collection_id, "live/", "", 10);
  assert(keys.size() == 2);
  assert(keys[0].key == "live/a");
  assert(keys[1].key == "live/b");
  assert(keys[1].size == 2);

  auto after = repo.ListLiveKeys(*tx, collection_id, "live/", "live/a", 10);
  assert(after.size() == 1);
  assert(after[0].key == "live/b");

  assert(repo.ListLiveKeys(*tx, collection_id, "live", "", 1).size() == 1);
  tx->Commit();
}

void VerifyConjoinedLifecycle(Repository& repo, uint64_t collection_id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertConjoined(*tx, ConjoinedRecord{.unified_id = 60, .collection_id = collection_id, .key = "multi", .create_ms = 1}));
    assert(repo.InsertConjoined(*tx, ConjoinedRecord{.unified_id = 61, .collection_id = collection_id, .key = "alpha", .create_ms = 2}));
    assert(repo.InsertConjoined(*tx, ConjoinedRecord{.unified_id = 62, .collection_id = collection_id, .key = "zulu", .create_ms = 3}));
    const auto duplicate = repo.InsertConjoined(*tx, ConjoinedRecord{.unified_id = 60, .collection_id = collection_id, .key = "multi"});
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertConjoined(*tx, ConjoinedRecord{.unified_id = 60, .collection_id = collection_id, .key = "multi", .create_ms = 1}));
    assert(repo.InsertConjoined(*tx, ConjoinedRecord{.unified_id = 61, .collection_id = collection_id, .key = "alpha", .create_ms = 2}));
    assert(repo.InsertConjoined(*tx, ConjoinedRecord{.unified_id = 62, .collection_id = collection_id, .key = "zulu", .create_ms = 3}));
    assert(repo.InsertSegment(*tx, Row(collection_id, "multi", 60, 0, 0, 8, SegmentStatus::Active)));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto record = repo.GetConjoined(*tx, collection_id, 60);
  assert(record.has_value());
  assert(record->State() == ConjoinedState::Active);
  assert(!repo.GetCurrentVersion(*tx, collection_id, "multi").has_value());

  record->complete_ms = 99;
  assert(repo.UpdateSegmentStatus(*tx, collection_id, 60, SegmentStatus::Active, SegmentStatus::Final));
  assert(repo.UpdateConjoined(*tx, *record));
  tx->Commit();

  tx      = repo.Begin();
  record  = repo.GetConjoined(*tx, collection_id, 60);
  assert(record->State() == ConjoinedState::Completed);
  assert(*record->complete_ms == 99);
  assert(!record->abort_ms.has_value());
  assert(repo.GetCurrentVersion(*tx, collection_id, "multi")->size == 8);

  const auto all = repo.ListConjoined(*tx, collection_id, "", 0, 10);
  assert(all.size() == 3);
  assert(all[0].unified_id == 60);
  assert(all[2].unified_id == 62);

  const auto by_id = repo.ListConjoined(*tx, collection_id, "", 60, 10);
  assert(by_id.size() == 2);
  assert(by_id[0].unified_id == 61);

  const auto by_key = repo.ListConjoined(*tx, collection_id, "multi", 0, 10);
  assert(by_key.size() == 1);
  assert(by_key[0].key == "zulu");

  assert(repo.UpdateConjoined(*tx, ConjoinedRecord{.unified_id = 999, .collection_id = collection_id, .key = "ghost"}).code ==
         ErrorCode::NotFound);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, uint64_t collection_id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertSegment(*tx, Row(collection_id, "rolled-back", 70, 0, 0, 1)));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertSegment(*tx, Row(collection_id, "abandoned", 71, 0, 0, 1)));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetCurrentVersion(*tx, collection_id, "rolled-back").has_value());
  assert(!repo.GetCurrentVersion(*tx, collection_id, "abandoned").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& name) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo          = backend.make_repository();
  const auto collection_id = CreateCollection(*repo, name);
  Insert(*repo, {Row(collection_id, "durable", 80, 0, 0, 11)});

  backend.restart(repo);

  auto tx         = repo->Begin();
  auto collection = repo->GetCollectionByName(*tx, name);
  assert(collection.has_value());
  assert(collection->id == collection_id);
  auto current = repo->GetCurrentVersion(*tx, collection_id, "durable");
  assert(current.has_value());
  assert(current->size == 11);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if CIRRUS_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("cirrus_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<cirrus::db::sqlite::SqliteDB>(db_path, 5000, true);
    cirrus::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<cirrus::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if CIRRUS_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("CIRRUS_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("CIRRUS_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<cirrus::db::postgres::PgPool>(conninfo, 4, std::chrono::milliseconds(5000));
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      tx.exec("DROP TABLE IF EXISTS conjoined, segment, collection;");
      tx.commit();
    }
    cirrus::db::postgres::PgRepository::BootstrapSchema(*pool);
    return std::make_shared<cirrus::db::postgres::PgRepository>(std::move(pool));
  };

  auto reconnect = [conninfo](std::shared_ptr<Repository>& repo) {
    auto pool = std::make_shared<cirrus::db::postgres::PgPool>(conninfo, 4, std::chrono::milliseconds(5000));
    repo      = std::make_shared<cirrus::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = reconnect,
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyCollections(*repo, backend.name + "-collections");

  const auto collection_id = CreateCollection(*repo, backend.name + "-objects");
  VerifyVersionsAndTombstones(*repo, collection_id);
  VerifyUnifiedIdOwnership(*repo, collection_id);
  VerifyListLiveKeys(*repo, collection_id);
  VerifyConjoinedLifecycle(*repo, collection_id);
  VerifyRollbackBehavior(*repo, collection_id);

  repo.reset();
  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

// Read-only memory transactions look at the committed state in place.
void VerifyMemoryReadsDoNotCopy() {
  MemoryRepository repo;
  const auto       collection_id = CreateCollection(repo, "memory-reads");
  Insert(repo, {Row(collection_id, "k", 90, 0, 0, 3)});

  {
    auto  tx   = repo.Begin();
    auto& mtx  = static_cast<cirrus::db::memory::MemoryTransaction&>(*tx);
    auto  head = repo.GetCurrentVersion(*tx, collection_id, "k");
    assert(head && head->unified_id == 90);
    assert(repo.GetSegments(*tx, collection_id, 90).size() == 1);
    assert(!mtx.HasWrites());
    tx->Commit();
  }
  {
    auto  tx  = repo.Begin();
    auto& mtx = static_cast<cirrus::db::memory::MemoryTransaction&>(*tx);
    assert(repo.InsertSegment(*tx, Row(collection_id, "k", 91, 0, 0, 4)));
    assert(mtx.HasWrites());
    assert(repo.GetCurrentVersion(*tx, collection_id, "k")->unified_id == 91);
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(repo.GetCurrentVersion(*tx, collection_id, "k")->unified_id == 90);
  tx->Commit();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if CIRRUS_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if CIRRUS_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifyMemoryReadsDoNotCopy();

  std::cout << "cirrus_integration_repository_parity: pass\n";
  return 0;
}
