#include "snowgen/core/clock.h"
#include "snowgen/snowflake/sequence_seed.h"
#include "snowgen/snowflake/snowflake.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <set>
#include <vector>

using namespace snowgen;
using snowflake::Snowflake;
using snowflake::SnowflakeOptions;

namespace {

constexpr std::int64_t kEpochSeconds = 1'650'000'000;
constexpr std::int64_t kEpochMillis = kEpochSeconds * 1000;
constexpr std::int64_t kStart = kEpochMillis + 10'000;

}  // namespace

// ── First ID ────────────────────────────────────────────────────────────────

TEST_CASE("next: first ID carries the clock reading relative to the epoch",
          "[snowflake][next]") {
  core::ManualClock clock(kStart);
  snowflake::ZeroSequenceSeed seed;
  Snowflake generator(SnowflakeOptions{kEpochSeconds, 5, 6}, clock, seed);

  const auto parsed = generator.parse(generator.next());
  CHECK(parsed.timestamp == 10'000);
  CHECK(parsed.sequence == 0);
  CHECK(parsed.worker_id == 5);
  CHECK(parsed.datacenter_id == 6);
  CHECK(generator.last_timestamp() == kStart);
}

TEST_CASE("next: repeated calls within one millisecond increment the sequence",
          "[snowflake][next]") {
  core::ManualClock clock(kStart);
  snowflake::ZeroSequenceSeed seed;
  Snowflake generator(SnowflakeOptions{kEpochSeconds, 1, 1}, clock, seed);

  for (std::int64_t expected = 0; expected < 5; ++expected) {
    const auto parsed = generator.parse(generator.next());
    CHECK(parsed.timestamp == 10'000);
    CHECK(parsed.sequence == expected);
  }
}

TEST_CASE("next: a new millisecond takes its sequence from the seed", "[snowflake][next]") {
  core::ManualClock clock(kStart);
  snowflake::RandomSequenceSeed seed;
  Snowflake generator(SnowflakeOptions{kEpochSeconds, 1, 1}, clock, seed);

  for (int i = 0; i < 200; ++i) {
    clock.advance(1);
    const auto parsed = generator.parse(generator.next());
    CHECK(parsed.sequence >= 0);
    CHECK(parsed.sequence <= snowflake::kMaxSequence);
  }
}

// ── Monotonicity and uniqueness ─────────────────────────────────────────────

TEST_CASE("next: IDs strictly increase under a manual clock", "[snowflake][next][ordering]") {
  core::ManualClock clock(kStart);
  snowflake::RandomSequenceSeed seed;
  Snowflake generator(SnowflakeOptions{kEpochSeconds, 2, 3}, clock, seed);

  std::uint64_t previous = 0;
  std::int64_t previous_last_timestamp = generator.last_timestamp();
  for (int i = 0; i < 20'000; ++i) {
    if (i % 97 == 0) {
      clock.advance(1);
    }
    const std::uint64_t id = generator.next();
    CHECK(id > previous);
    // lastTimestamp never decreases across successful calls.
    CHECK(generator.last_timestamp() >= previous_last_timestamp);
    previous = id;
    previous_last_timestamp = generator.last_timestamp();
  }
}

TEST_CASE("next: IDs strictly increase and are unique on the system clock",
          "[snowflake][next][ordering]") {
  Snowflake generator(SnowflakeOptions{std::nullopt, 7, 8});

  std::vector<std::uint64_t> ids;
  ids.reserve(20'000);
  for (int i = 0; i < 20'000; ++i) {
    ids.push_back(generator.next());
  }

  for (std::size_t i = 1; i < ids.size(); ++i) {
    REQUIRE(ids[i] > ids[i - 1]);
  }
  const std::set<std::uint64_t> unique(ids.begin(), ids.end());
  CHECK(unique.size() == ids.size());

  const auto parsed = generator.parse(ids.back());
  CHECK(parsed.worker_id == 7);
  CHECK(parsed.datacenter_id == 8);
}

TEST_CASE("next: IDs never use bit 63 for in-range timestamps", "[snowflake][next]") {
  Snowflake generator;
  CHECK((generator.next() >> 63) == 0);
}

// ── Clock source ────────────────────────────────────────────────────────────

TEST_CASE("timestamp: reads the injected clock", "[snowflake][clock]") {
  core::ManualClock clock(kStart);
  snowflake::ZeroSequenceSeed seed;
  Snowflake generator(SnowflakeOptions{kEpochSeconds, 1, 1}, clock, seed);

  CHECK(generator.timestamp() == kStart);
  clock.advance(42);
  CHECK(generator.timestamp() == kStart + 42);
}
