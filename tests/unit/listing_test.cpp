#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/access/authenticator.hpp"
#include "internal/accounting/bounded_space_accounting.hpp"
#include "internal/accounting/memory_space_accounting.hpp"
#include "internal/conjoined/conjoined_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ids/id_translator.hpp"
#include "internal/ids/unified_id_factory.hpp"
#include "internal/observability/fault_reporter.hpp"
#include "internal/retrieval/retrieval_engine.hpp"
#include "internal/service/read_service.hpp"
#include "internal/service/write_service.hpp"
#include "internal/storage/ram/ram_segment_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using cirrus::service::ArchiveParams;
using cirrus::service::ListKeysParams;
using cirrus::service::ListVersionsParams;

// Every call waits until released.
class StalledAccounting final : public cirrus::accounting::SpaceAccounting {
 public:
  void Added(uint64_t, uint64_t, uint64_t) override {
    Wait();
  }
  void Removed(uint64_t, uint64_t, uint64_t) override {
    Wait();
  }
  void Retrieved(uint64_t, uint64_t, uint64_t) override {
    Wait();
  }
  std::vector<cirrus::accounting::DailyUsage> Usage(uint64_t) override {
    Wait();
    return {};
  }

  std::atomic<bool> released{false};
  std::atomic<int>  finished{0};

 private:
  void Wait() {
    while (!released) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ++finished;
  }
};

struct Fixture {
  std::shared_ptr<cirrus::db::memory::MemoryRepository> repository = std::make_shared<cirrus::db::memory::MemoryRepository>();
  std::shared_ptr<cirrus::storage::RamSegmentStore>     store      = std::make_shared<cirrus::storage::RamSegmentStore>();
  cirrus::service::ServiceContext                       ctx;
  std::unique_ptr<cirrus::service::ReadService>         read;
  std::unique_ptr<cirrus::service::WriteService>        write;
  uint64_t                                              collection_id = 0;

  explicit Fixture(uint64_t max_segment_bytes = 4, cirrus::accounting::SpaceAccountingPtr accounting = nullptr) {
    cirrus::ids::TranslatorKeys keys;
    keys.aes_key  = std::string(32, 'l');
    keys.hmac_key = "listing-hmac";
    keys.iv_key   = "listing-iv";

    auto faults = std::make_shared<cirrus::observability::LoggingFaultReporter>();

    ctx.repository    = repository;
    ctx.store         = store;
    ctx.ids           = std::make_shared<cirrus::ids::UnifiedIdFactory>(1);
    ctx.translator    = std::make_shared<cirrus::ids::IdTranslator>(keys);
    ctx.faults        = faults;
    ctx.retrieval     = std::make_shared<cirrus::retrieval::RetrievalEngine>(repository, store, ctx.translator, faults, 1024);
    ctx.conjoined     = std::make_shared<cirrus::conjoined::ConjoinedManager>(repository, ctx.ids, ctx.translator, 1000);
    ctx.accounting    = accounting ? std::move(accounting) : std::make_shared<cirrus::accounting::MemorySpaceAccounting>();
    ctx.authenticator = std::make_shared<cirrus::access::PasswordAuthenticator>();
    ctx.limits.max_segment_bytes = max_segment_bytes;
    ctx.limits.max_list_entries  = 100;

    read  = std::make_unique<cirrus::service::ReadService>(ctx);
    write = std::make_unique<cirrus::service::WriteService>(ctx);

    cirrus::db::model::CollectionRecord collection;
    collection.name = "listing";
    auto tx         = repository->Begin();
    assert(repository->InsertCollection(*tx, collection));
    tx->Commit();
    collection_id = collection.id;
  }

  std::string Archive(const std::string& key, const std::string& body) {
    return write->ArchiveKey(collection_id, key, body, {}).version_identifier();
  }

  std::string Fetch(const std::string& key) {
    cirrus::retrieval::RetrievalRequest req;
    req.collection_id = collection_id;
    req.key           = key;
    auto        result = read->Retrieve(req);
    std::string out;
    while (auto chunk = result.body->Next()) {
      out.append(reinterpret_cast<const char*>(chunk->data()), static_cast<std::size_t>(chunk->size()));
    }
    return out;
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestArchiveSplitsBodyIntoSegments() {
  Fixture f(4);
  const auto version = f.Archive("notes.txt", "abcdefghij");
  assert(!version.empty());
  assert(f.store->SegmentCount() == 3);
  assert(f.Fetch("notes.txt") == "abcdefghij");

  const auto meta = f.read->Metadata(f.collection_id, "notes.txt", std::nullopt);
  assert(meta.version_identifier() == version);
  assert(meta.file_size() == 10);
  assert(meta.segment_count() == 3);
  assert(meta.content_type() == "text/plain");
}

void TestArchiveEmptyBodyAndBadRequests() {
  Fixture f;
  (void)f.Archive("empty", "");
  assert(f.store->SegmentCount() == 1);
  assert(f.Fetch("empty").empty());

  assert(Throws<cirrus::util::ClientSyntaxError>([&] { (void)f.Archive("", "x"); }));

  ArchiveParams orphan_part;
  orphan_part.conjoined_part = 2;
  assert(Throws<cirrus::util::ClientSyntaxError>([&] { (void)f.write->ArchiveKey(f.collection_id, "k", "x", orphan_part); }));
}

void TestDeleteWritesTombstone() {
  Fixture f;
  (void)f.Archive("doomed", "12345678");
  const auto deleted = f.write->DeleteKey(f.collection_id, "doomed");
  assert(deleted.success());
  assert(!deleted.version_identifier().empty());

  assert(Throws<cirrus::util::NotFound>([&] { (void)f.Fetch("doomed"); }));
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.write->DeleteKey(f.collection_id, "doomed"); }));
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.write->DeleteKey(f.collection_id, "never-there"); }));

  // a new archive revives the key
  (void)f.Archive("doomed", "back");
  assert(f.Fetch("doomed") == "back");
}

void TestListKeysCollapsesDelimitedPrefixes() {
  Fixture f(1024);
  for (const auto* key : {"a/1", "a/2", "b/1", "c", "d/x/y"}) {
    (void)f.Archive(key, key);
  }

  ListKeysParams params;
  params.delimiter = "/";
  auto all         = f.read->ListKeys(f.collection_id, params);
  assert(!all.truncated());
  assert(all.prefixes_size() == 3);
  assert(all.prefixes(0) == "a/");
  assert(all.prefixes(1) == "b/");
  assert(all.prefixes(2) == "d/");
  assert(all.key_data_size() == 1);
  assert(all.key_data(0).key() == "c");
  assert(all.key_data(0).file_size() == 1);

  params.max_keys = 2;
  auto first      = f.read->ListKeys(f.collection_id, params);
  assert(first.truncated());
  assert(first.prefixes_size() == 2);
  assert(first.key_data_size() == 0);

  params.marker = "b/";
  auto second   = f.read->ListKeys(f.collection_id, params);
  assert(!second.truncated());
  assert(second.key_data_size() == 1);
  assert(second.key_data(0).key() == "c");
  assert(second.prefixes_size() == 1);
  assert(second.prefixes(0) == "d/");

  ListKeysParams nested;
  nested.prefix    = "d/";
  nested.delimiter = "/";
  auto under_d     = f.read->ListKeys(f.collection_id, nested);
  assert(under_d.prefixes_size() == 1);
  assert(under_d.prefixes(0) == "d/x/");
}

void TestListKeysHidesDeletedKeys() {
  Fixture f(1024);
  (void)f.Archive("keep", "1");
  (void)f.Archive("gone", "2");
  (void)f.write->DeleteKey(f.collection_id, "gone");

  ListKeysParams params;
  auto           listed = f.read->ListKeys(f.collection_id, params);
  assert(listed.key_data_size() == 1);
  assert(listed.key_data(0).key() == "keep");

  params.prefix = "zzz";
  assert(f.read->ListKeys(f.collection_id, params).key_data_size() == 0);
}

void TestListVersionsIncludesDeleteMarkers() {
  Fixture f(1024);
  const auto v1 = f.Archive("doc", "one");
  const auto v2 = f.Archive("doc", "three");
  (void)f.write->DeleteKey(f.collection_id, "doc");
  (void)f.Archive("other", "x");

  ListVersionsParams params;
  params.prefix = "doc";
  auto versions = f.read->ListVersions(f.collection_id, params);
  assert(!versions.truncated());
  assert(versions.version_data_size() == 3);
  assert(versions.version_data(0).version_identifier() == v1);
  assert(versions.version_data(0).file_size() == 3);
  assert(versions.version_data(1).version_identifier() == v2);
  assert(!versions.version_data(1).delete_marker());
  assert(versions.version_data(2).delete_marker());
  assert(versions.version_data(2).file_size() == 0);

  ListVersionsParams page;
  page.max_versions              = 1;
  page.key_marker                = "doc";
  page.version_identifier_marker = v1;
  auto next                      = f.read->ListVersions(f.collection_id, page);
  assert(next.truncated());
  assert(next.version_data_size() == 1);
  assert(next.version_data(0).version_identifier() == v2);
}

void TestConjoinedArchiveThroughWriteService() {
  Fixture f(4);
  const auto id = f.write->StartConjoined(f.collection_id, "video").conjoined_identifier();

  ArchiveParams part1;
  part1.conjoined_identifier = id;
  part1.conjoined_part       = 1;
  ArchiveParams part2        = part1;
  part2.conjoined_part       = 2;
  assert(f.write->ArchiveKey(f.collection_id, "video", "part-one", part1).version_identifier() == id);
  (void)f.write->ArchiveKey(f.collection_id, "video", "two", part2);

  // parts stay invisible until the archive is finished
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.Fetch("video"); }));
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.write->ArchiveKey(f.collection_id, "audio", "x", part1); }));

  const auto uploads = f.read->ListUploads(f.collection_id, "video", id);
  assert(uploads.upload_list_size() == 2);
  assert(uploads.upload_list(0).segment_count() == 2);

  (void)f.write->FinishConjoined(f.collection_id, "video", id);
  assert(f.Fetch("video") == "part-onetwo");

  assert(Throws<cirrus::util::Conflict>([&] { (void)f.write->ArchiveKey(f.collection_id, "video", "late", part1); }));
  assert(Throws<cirrus::util::Conflict>([&] { (void)f.write->AbortConjoined(f.collection_id, "video", id); }));

  auto listed = f.read->ListConjoined(f.collection_id, {});
  assert(listed.conjoined_list_size() == 1);
  assert(listed.conjoined_list(0).state() == "completed");
}

void TestRepeatedConjoinedPartKeepsCommittedBytes() {
  Fixture f(4);
  const auto id = f.write->StartConjoined(f.collection_id, "video").conjoined_identifier();

  ArchiveParams part1;
  part1.conjoined_identifier = id;
  part1.conjoined_part       = 1;
  (void)f.write->ArchiveKey(f.collection_id, "video", "part-one", part1);
  assert(f.store->SegmentCount() == 2);

  assert(Throws<cirrus::util::Conflict>([&] { (void)f.write->ArchiveKey(f.collection_id, "video", "again", part1); }));
  assert(f.store->SegmentCount() == 2);

  (void)f.write->FinishConjoined(f.collection_id, "video", id);
  assert(f.Fetch("video") == "part-one");
}

void TestAbortedConjoinedLeavesNothingVisible() {
  Fixture f;
  const auto id = f.write->StartConjoined(f.collection_id, "scratch").conjoined_identifier();

  ArchiveParams part;
  part.conjoined_identifier = id;
  (void)f.write->ArchiveKey(f.collection_id, "scratch", "data", part);
  (void)f.write->AbortConjoined(f.collection_id, "scratch", id);

  assert(Throws<cirrus::util::NotFound>([&] { (void)f.Fetch("scratch"); }));
  assert(f.read->ListKeys(f.collection_id, {}).key_data_size() == 0);
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.write->FinishConjoined(f.collection_id, "elsewhere", id); }));
}

void TestSpaceUsageTracksTraffic() {
  Fixture f(1024);
  (void)f.Archive("a", "12345");
  (void)f.Archive("b", "123");
  (void)f.write->DeleteKey(f.collection_id, "b");
  (void)f.Fetch("a");

  const auto usage = f.read->SpaceUsage(f.collection_id, "listing");
  assert(usage.collection() == "listing");
  assert(usage.usage_size() == 1);
  assert(usage.usage(0).bytes_added() == 8);
  assert(usage.usage(0).bytes_removed() == 3);
  assert(usage.usage(0).bytes_retrieved() == 5);
}

void TestStalledAccountingHitsTheCeiling() {
  auto stalled = std::make_shared<StalledAccounting>();
  Fixture f(1024, std::make_shared<cirrus::accounting::BoundedSpaceAccounting>(stalled, std::chrono::milliseconds(20)));

  // the write is committed even though its usage could not be recorded
  (void)f.Archive("a", "12345");
  assert(f.Fetch("a") == "12345");
  assert(Throws<cirrus::util::DependencyUnavailable>([&] { (void)f.read->SpaceUsage(f.collection_id, "listing"); }));

  stalled->released = true;
  while (stalled->finished < 3) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

} // namespace

int main() {
  TestArchiveSplitsBodyIntoSegments();
  TestArchiveEmptyBodyAndBadRequests();
  TestDeleteWritesTombstone();
  TestListKeysCollapsesDelimitedPrefixes();
  TestListKeysHidesDeletedKeys();
  TestListVersionsIncludesDeleteMarkers();
  TestConjoinedArchiveThroughWriteService();
  TestRepeatedConjoinedPartKeepsCommittedBytes();
  TestAbortedConjoinedLeavesNothingVisible();
  TestSpaceUsageTracksTraffic();
  TestStalledAccountingHitsTheCeiling();

  std::cout << "cirrus_unit_listing: pass\n";
  return 0;
}
