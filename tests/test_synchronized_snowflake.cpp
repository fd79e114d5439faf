#include "snowgen/core/clock.h"
#include "snowgen/snowflake/sequence_seed.h"
#include "snowgen/snowflake/synchronized_snowflake.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <set>
#include <thread>
#include <vector>

using namespace snowgen;
using snowflake::SnowflakeOptions;
using snowflake::SynchronizedSnowflake;

TEST_CASE("SynchronizedSnowflake: concurrent callers receive unique IDs",
          "[snowflake][concurrency]") {
  SynchronizedSnowflake generator(SnowflakeOptions{std::nullopt, 4, 5});

  constexpr int kThreads = 4;
  constexpr int kPerThread = 5'000;
  std::vector<std::vector<std::uint64_t>> per_thread(kThreads);

  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&generator, &out = per_thread[t]] {
      out.reserve(kPerThread);
      for (int i = 0; i < kPerThread; ++i) {
        out.push_back(generator.next());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::uint64_t> all;
  for (const auto& ids : per_thread) {
    // Each thread observes its own IDs in increasing order.
    for (std::size_t i = 1; i < ids.size(); ++i) {
      REQUIRE(ids[i] > ids[i - 1]);
    }
    all.insert(ids.begin(), ids.end());
  }
  CHECK(all.size() == static_cast<std::size_t>(kThreads * kPerThread));
}

TEST_CASE("SynchronizedSnowflake: forwards to the wrapped generator", "[snowflake][concurrency]") {
  constexpr std::int64_t kEpochSeconds = 1'650'000'000;
  core::ManualClock clock(kEpochSeconds * 1000 + 77);
  snowflake::ZeroSequenceSeed seed;
  SynchronizedSnowflake generator(SnowflakeOptions{kEpochSeconds, 3, 2}, clock, seed);

  CHECK(generator.timestamp() == kEpochSeconds * 1000 + 77);

  const auto parsed = generator.parse(generator.next());
  CHECK(parsed.timestamp == 77);
  CHECK(parsed.sequence == 0);
  CHECK(parsed.worker_id == 3);
  CHECK(parsed.datacenter_id == 2);

  CHECK(generator.short_id() == ((std::uint64_t{77} << 12) | 1));
  CHECK(generator.to_snowflake_id(1, 4) ==
        ((std::uint64_t{1} << 22) | (std::uint64_t{2} << 17) | (std::uint64_t{3} << 12) | 4));
}
