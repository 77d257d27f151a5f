#include "internal/retrieval/retrieval_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/ram/ram_segment_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using cirrus::db::model::SegmentRecord;
using cirrus::db::model::SegmentStatus;
using cirrus::retrieval::RetrievalEngine;
using cirrus::retrieval::RetrievalRequest;
using cirrus::retrieval::RetrievalStatus;

constexpr uint64_t kStoredAtMs = 1700000000000ULL;

struct Fixture {
  std::shared_ptr<cirrus::db::memory::MemoryRepository>        repository = std::make_shared<cirrus::db::memory::MemoryRepository>();
  std::shared_ptr<cirrus::storage::RamSegmentStore>            store      = std::make_shared<cirrus::storage::RamSegmentStore>();
  std::shared_ptr<cirrus::observability::LoggingFaultReporter> faults = std::make_shared<cirrus::observability::LoggingFaultReporter>();
  std::shared_ptr<cirrus::ids::IdTranslator>                   translator;
  std::unique_ptr<RetrievalEngine>                             engine;
  uint64_t                                                     collection_id = 0;

  Fixture() {
    cirrus::ids::TranslatorKeys keys;
    keys.aes_key  = std::string(32, 'a');
    keys.hmac_key = "hmac";
    keys.iv_key   = "iv";
    translator    = std::make_shared<cirrus::ids::IdTranslator>(keys);
    engine        = std::make_unique<RetrievalEngine>(repository, store, translator, faults, 4);

    cirrus::db::model::CollectionRecord collection;
    collection.name = "photos";
    auto tx         = repository->Begin();
    assert(repository->InsertCollection(*tx, collection));
    tx->Commit();
    collection_id = collection.id;
  }

  // Stores one version made of the given segments.
  void Put(const std::string& key, uint64_t unified_id, const std::vector<std::string>& segments,
           SegmentStatus status = SegmentStatus::Final, uint64_t timestamp_ms = kStoredAtMs) {
    auto     tx     = repository->Begin();
    uint64_t offset = 0;
    uint32_t seq    = 0;
    for (const auto& bytes : segments) {
      SegmentRecord row;
      row.collection_id    = collection_id;
      row.key              = key;
      row.unified_id       = unified_id;
      row.sequence_no      = seq;
      row.offset           = offset;
      row.size             = bytes.size();
      row.timestamp_ms     = timestamp_ms;
      row.status           = status;
      row.storage_location = store->Write({collection_id, unified_id, 0, seq}, cirrus::storage::common::CopyToBuffer(bytes));
      assert(repository->InsertSegment(*tx, row));
      offset += bytes.size();
      ++seq;
    }
    tx->Commit();
  }

  void Tombstone(const std::string& key, uint64_t unified_id) {
    SegmentRecord row;
    row.collection_id = collection_id;
    row.key           = key;
    row.unified_id    = unified_id;
    row.timestamp_ms  = kStoredAtMs;
    row.status        = SegmentStatus::Tombstone;
    auto tx           = repository->Begin();
    assert(repository->InsertSegment(*tx, row));
    tx->Commit();
  }

  RetrievalRequest Request(const std::string& key) const {
    RetrievalRequest req;
    req.collection_id = collection_id;
    req.key           = key;
    return req;
  }
};

std::string Drain(cirrus::retrieval::ByteStream& stream) {
  std::string out;
  while (auto chunk = stream.Next()) {
    out.append(reinterpret_cast<const char*>(chunk->data()), static_cast<std::size_t>(chunk->size()));
  }
  return out;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFullRetrievalConcatenatesSegments() {
  Fixture f;
  f.Put("a.txt", 100, {"hello ", "segmented ", "world"});

  auto result = f.engine->Retrieve(f.Request("a.txt"));
  assert(result.status == RetrievalStatus::Ok);
  assert(result.content_length == 21);
  assert(!result.content_range);
  assert(result.metadata.content_type == "text/plain");
  assert(result.metadata.segment_count == 3);
  assert(result.metadata.last_modified_ms == kStoredAtMs);
  assert(f.translator->InternalId(result.metadata.version_identifier) == 100);
  assert(Drain(*result.body) == "hello segmented world");
}

void TestClosedRangeReturnsPartialContent() {
  Fixture f;
  f.Put("k", 100, {"0123456789", "abcdefghij"});

  auto req  = f.Request("k");
  req.range = "bytes=8-12";
  auto result = f.engine->Retrieve(req);
  assert(result.status == RetrievalStatus::Partial);
  assert(result.content_length == 5);
  assert(*result.content_range == "bytes 8-12/20");
  assert(Drain(*result.body) == "89abc");
}

void TestOpenRangeAndOversizedUpperBound() {
  Fixture f;
  f.Put("k", 100, {"0123456789"});

  auto req  = f.Request("k");
  req.range = "bytes=7-";
  auto open = f.engine->Retrieve(req);
  assert(*open.content_range == "bytes 7-9/10");
  assert(Drain(*open.body) == "789");

  req.range  = "bytes=5-500";
  auto clamp = f.engine->Retrieve(req);
  assert(*clamp.content_range == "bytes 5-9/10");
  assert(clamp.content_length == 5);

  req.range = "bytes=0-18446744073709551615";
  auto widest = f.engine->Retrieve(req);
  assert(widest.status == RetrievalStatus::Partial);
  assert(*widest.content_range == "bytes 0-9/10");
  assert(widest.content_length == 10);
  assert(Drain(*widest.body) == "0123456789");
}

void TestRangeBeyondObjectIsClientSyntax() {
  Fixture f;
  f.Put("k", 100, {"0123456789"});

  auto req  = f.Request("k");
  req.range = "bytes=10-";
  assert(Throws<cirrus::util::ClientSyntaxError>([&] { (void)f.engine->Retrieve(req); }));

  req.range = "bytes=x-";
  assert(Throws<cirrus::util::ClientSyntaxError>([&] { (void)f.engine->Retrieve(req); }));
}

void TestMissingKeyIsNotFoundBeforeRangeChecks() {
  Fixture f;
  auto    req = f.Request("absent");
  req.range   = "garbage";
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.engine->Retrieve(req); }));
}

void TestConditionalHeaders() {
  Fixture f;
  f.Put("k", 100, {"data"});

  auto req              = f.Request("k");
  req.if_modified_since = cirrus::util::FormatHttpDate(kStoredAtMs + 1000);
  auto not_modified     = f.engine->Retrieve(req);
  assert(not_modified.status == RetrievalStatus::NotModified);
  assert(!not_modified.body);

  req.if_modified_since = cirrus::util::FormatHttpDate(kStoredAtMs);
  assert(f.engine->Retrieve(req).status == RetrievalStatus::Ok);

  req.if_modified_since   = std::nullopt;
  req.if_unmodified_since = cirrus::util::FormatHttpDate(kStoredAtMs - 1000);
  auto failed             = f.engine->Retrieve(req);
  assert(failed.status == RetrievalStatus::PreconditionFailed);
  assert(!failed.body);

  req.if_unmodified_since = cirrus::util::FormatHttpDate(kStoredAtMs);
  assert(f.engine->Retrieve(req).status == RetrievalStatus::Ok);

  req.if_unmodified_since = "yesterday";
  assert(Throws<cirrus::util::ClientSyntaxError>([&] { (void)f.engine->Retrieve(req); }));
}

void TestExplicitVersionAndTombstones() {
  Fixture f;
  f.Put("k", 100, {"old"});
  f.Put("k", 200, {"new"});

  auto current = f.engine->Retrieve(f.Request("k"));
  assert(Drain(*current.body) == "new");

  auto req               = f.Request("k");
  req.version_identifier = f.translator->PublicId(100);
  assert(Drain(*f.engine->Retrieve(req).body) == "old");

  f.Tombstone("k", 300);
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.engine->Retrieve(f.Request("k")); }));
  // older versions stay reachable by identifier
  assert(Drain(*f.engine->Retrieve(req).body) == "old");

  req.version_identifier = f.translator->PublicId(300);
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.engine->Retrieve(req); }));

  req.version_identifier = "bogus";
  assert(Throws<cirrus::util::ClientSyntaxError>([&] { (void)f.engine->Retrieve(req); }));
}

void TestVersionOfAnotherKeyIsNotFound() {
  Fixture f;
  f.Put("a", 100, {"aaa"});
  f.Put("b", 200, {"bbb"});

  auto req               = f.Request("a");
  req.version_identifier = f.translator->PublicId(200);
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.engine->Retrieve(req); }));
}

void TestActiveSegmentsAreInvisible() {
  Fixture f;
  f.Put("k", 100, {"pending"}, SegmentStatus::Active);
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.engine->Retrieve(f.Request("k")); }));
}

void TestHeadReportsSizeWithoutBody() {
  Fixture f;
  f.Put("k", 100, {"0123456789"});

  auto req         = f.Request("k");
  req.headers_only = true;
  req.range        = "bytes=2-3";
  auto result      = f.engine->Retrieve(req);
  assert(result.status == RetrievalStatus::Ok);
  assert(result.content_length == 10);
  assert(!result.body);
}

void TestEmptyObjectIgnoresRange() {
  Fixture f;
  f.Put("empty", 100, {""});

  auto req    = f.Request("empty");
  req.range   = "bytes=0-10";
  auto result = f.engine->Retrieve(req);
  assert(result.status == RetrievalStatus::Ok);
  assert(result.content_length == 0);
  assert(Drain(*result.body).empty());
}

void TestSegmentGapIsReportedFault() {
  Fixture f;
  auto    tx = f.repository->Begin();
  for (uint32_t seq = 0; seq < 2; ++seq) {
    SegmentRecord row;
    row.collection_id    = f.collection_id;
    row.key              = "gap";
    row.unified_id       = 100;
    row.sequence_no      = seq;
    row.offset           = seq * 10; // second segment should start at 4
    row.size             = 4;
    row.timestamp_ms     = kStoredAtMs;
    row.storage_location = "missing";
    assert(f.repository->InsertSegment(*tx, row));
  }
  tx->Commit();

  assert(Throws<cirrus::util::InternalError>([&] { (void)f.engine->Retrieve(f.Request("gap")); }));
  assert(f.faults->ReportedCount() == 1);
}

void TestLostSegmentSurfacesWhileStreaming() {
  Fixture f;
  f.Put("k", 100, {"abcd", "efgh"});
  f.store->Remove(cirrus::storage::SegmentLocation({f.collection_id, 100, 0, 1}));

  auto result = f.engine->Retrieve(f.Request("k"));
  assert(result.body->Next() != nullptr);
  assert(Throws<cirrus::util::StorageError>([&] { (void)result.body->Next(); }));
}

void TestDescribe() {
  Fixture f;
  f.Put("doc.pdf", 100, {"12345", "678"});

  const auto meta = f.engine->Describe(f.collection_id, "doc.pdf", std::nullopt);
  assert(meta.total_size == 8);
  assert(meta.segment_count == 2);
  assert(meta.content_type == "application/pdf");
  assert(Throws<cirrus::util::NotFound>([&] { (void)f.engine->Describe(f.collection_id, "other", std::nullopt); }));
}

} // namespace

int main() {
  TestFullRetrievalConcatenatesSegments();
  TestClosedRangeReturnsPartialContent();
  TestOpenRangeAndOversizedUpperBound();
  TestRangeBeyondObjectIsClientSyntax();
  TestMissingKeyIsNotFoundBeforeRangeChecks();
  TestConditionalHeaders();
  TestExplicitVersionAndTombstones();
  TestVersionOfAnotherKeyIsNotFound();
  TestActiveSegmentsAreInvisible();
  TestHeadReportsSizeWithoutBody();
  TestEmptyObjectIgnoresRange();
  TestSegmentGapIsReportedFault();
  TestLostSegmentSurfacesWhileStreaming();
  TestDescribe();

  std::cout << "cirrus_unit_retrieval_engine: pass\n";
  return 0;
}
