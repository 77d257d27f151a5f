#include "internal/retrieval/byte_stream.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/observability/fault_reporter.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/ram/ram_segment_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using cirrus::retrieval::SegmentByteStream;
using cirrus::retrieval::SegmentSlice;
using cirrus::storage::RamSegmentStore;
using cirrus::storage::SegmentAddress;

// Counts reads and can be told to fail them.
class CountingStore final : public cirrus::storage::SegmentStore {
 public:
  std::string Write(const SegmentAddress& address, const std::shared_ptr<arrow::Buffer>& bytes) override {
    return inner_.Write(address, bytes);
  }

  std::shared_ptr<arrow::Buffer> Read(const std::string& location, uint64_t offset, uint64_t length) override {
    ++reads;
    if (fail_with_runtime_error) throw std::runtime_error("disk controller on fire");
    return inner_.Read(location, offset, length);
  }

  void Remove(const std::string& location) override {
    inner_.Remove(location);
  }

  std::atomic<int> reads{0};
  bool             fail_with_runtime_error = false;

 private:
  RamSegmentStore inner_;
};

std::string Put(CountingStore& store, uint32_t seq, const std::string& bytes) {
  return store.Write(SegmentAddress{1, 99, 0, seq}, cirrus::storage::common::CopyToBuffer(bytes));
}

std::string Drain(cirrus::retrieval::ByteStream& stream, std::size_t* chunks = nullptr) {
  std::string out;
  while (auto chunk = stream.Next()) {
    out.append(reinterpret_cast<const char*>(chunk->data()), static_cast<std::size_t>(chunk->size()));
    if (chunks) ++*chunks;
  }
  return out;
}

void TestChunksSpanSliceBoundaries() {
  auto store  = std::make_shared<CountingStore>();
  auto faults = std::make_shared<cirrus::observability::LoggingFaultReporter>();
  auto a      = Put(*store, 0, "abcde");
  auto b      = Put(*store, 1, "fghij");

  SegmentByteStream stream(store, {{a, 1, 4}, {b, 0, 3}}, 3, faults);
  assert(stream.Remaining() == 7);

  std::size_t chunks = 0;
  assert(Drain(stream, &chunks) == "bcdefgh");
  assert(chunks == 3);
  assert(stream.Remaining() == 0);
  assert(stream.Next() == nullptr);
}

void TestCancelStopsFetching() {
  auto store  = std::make_shared<CountingStore>();
  auto faults = std::make_shared<cirrus::observability::LoggingFaultReporter>();
  auto a      = Put(*store, 0, std::string(100, 'x'));

  SegmentByteStream stream(store, {{a, 0, 100}}, 10, faults);
  assert(stream.Next() != nullptr);
  const int reads_before_cancel = store->reads.load();

  stream.Cancel();
  assert(stream.Next() == nullptr);
  assert(stream.Next() == nullptr);
  assert(store->reads.load() == reads_before_cancel);
  assert(stream.Remaining() == 0);
}

void TestEmptyStreamEndsImmediately() {
  auto store  = std::make_shared<CountingStore>();
  auto faults = std::make_shared<cirrus::observability::LoggingFaultReporter>();

  SegmentByteStream stream(store, {}, 10, faults);
  assert(stream.Next() == nullptr);
  assert(store->reads.load() == 0);
}

void TestMissingSegmentIsStorageError() {
  auto store  = std::make_shared<CountingStore>();
  auto faults = std::make_shared<cirrus::observability::LoggingFaultReporter>();

  SegmentByteStream stream(store, {{"1-99-0-7", 0, 5}}, 10, faults);
  bool threw = false;
  try {
    (void)stream.Next();
  } catch (const cirrus::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(faults->ReportedCount() == 0);
  assert(stream.Next() == nullptr);
}

void TestUnexpectedFailureIsReportedAsFault() {
  auto store  = std::make_shared<CountingStore>();
  auto faults = std::make_shared<cirrus::observability::LoggingFaultReporter>();
  auto a      = Put(*store, 0, "abc");
  store->fail_with_runtime_error = true;

  SegmentByteStream stream(store, {{a, 0, 3}}, 10, faults);
  bool threw = false;
  try {
    (void)stream.Next();
  } catch (const cirrus::util::InternalError&) {
    threw = true;
  }
  assert(threw);
  assert(faults->ReportedCount() == 1);
}

} // namespace

int main() {
  TestChunksSpanSliceBoundaries();
  TestCancelStopsFetching();
  TestEmptyStreamEndsImmediately();
  TestMissingSegmentIsStorageError();
  TestUnexpectedFailureIsReportedAsFault();

  std::cout << "cirrus_unit_byte_stream: pass\n";
  return 0;
}
