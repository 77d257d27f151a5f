#include "internal/ids/unified_id_factory.hpp"

#include <cassert>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/util/time.hpp"

namespace {

using cirrus::ids::UnifiedId;
using cirrus::ids::UnifiedIdFactory;

void TestIdsStrictlyIncrease() {
  UnifiedIdFactory factory(7);

  UnifiedId previous = factory.Next();
  for (int i = 0; i < 20000; ++i) {
    const auto next = factory.Next();
    assert(next > previous);
    previous = next;
  }
}

void TestLayoutCarriesShardAndTimestamp() {
  UnifiedIdFactory factory(513);

  const auto before = cirrus::util::ToUnixMillis(cirrus::util::Now());
  const auto id     = factory.Next();
  const auto after  = cirrus::util::ToUnixMillis(cirrus::util::Now());

  assert(UnifiedIdFactory::ShardOf(id) == 513);
  assert(UnifiedIdFactory::TimestampMs(id) >= before);
  assert(UnifiedIdFactory::TimestampMs(id) <= after + 1);
  assert(factory.ShardId() == 513);
}

void TestShardOutOfRangeIsRejected() {
  bool threw = false;
  try {
    UnifiedIdFactory factory(UnifiedIdFactory::kMaxShardId + 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestDistinctShardsNeverCollide() {
  UnifiedIdFactory a(1);
  UnifiedIdFactory b(2);

  std::set<UnifiedId> seen;
  for (int i = 0; i < 5000; ++i) {
    assert(seen.insert(a.Next()).second);
    assert(seen.insert(b.Next()).second);
  }
}

void TestConcurrentCallersGetUniqueIds() {
  UnifiedIdFactory factory(3);

  std::mutex             mutex;
  std::vector<UnifiedId> all;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      std::vector<UnifiedId> local;
      for (int i = 0; i < 2000; ++i) local.push_back(factory.Next());
      std::lock_guard<std::mutex> lock(mutex);
      all.insert(all.end(), local.begin(), local.end());
    });
  }
  for (auto& thread : threads) thread.join();

  const std::set<UnifiedId> unique(all.begin(), all.end());
  assert(unique.size() == all.size());
}

} // namespace

int main() {
  TestIdsStrictlyIncrease();
  TestLayoutCarriesShardAndTimestamp();
  TestShardOutOfRangeIsRejected();
  TestDistinctShardsNeverCollide();
  TestConcurrentCallersGetUniqueIds();

  std::cout << "cirrus_unit_unified_id: pass\n";
  return 0;
}
