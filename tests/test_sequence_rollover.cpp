#include "snowgen/core/clock.h"
#include "snowgen/snowflake/errors.h"
#include "snowgen/snowflake/layout.h"
#include "snowgen/snowflake/sequence_seed.h"
#include "snowgen/snowflake/snowflake.h"

#include "support/scripted_clock.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <set>

using namespace snowgen;
using snowflake::Snowflake;
using snowflake::SnowflakeOptions;

namespace {

constexpr std::int64_t kEpochSeconds = 1'650'000'000;
constexpr std::int64_t kEpochMillis = kEpochSeconds * 1000;
constexpr std::int64_t kStart = kEpochMillis + 5'000;

class FixedSequenceSeed final : public snowflake::ISequenceSeed {
 public:
  explicit FixedSequenceSeed(std::int64_t value) : value_(value) {}
  std::int64_t initial_sequence() override { return value_; }

 private:
  std::int64_t value_;
};

}  // namespace

TEST_CASE("next: the 4097th ID in one millisecond moves to the next millisecond",
          "[snowflake][sequence]") {
  core::ManualClock clock(kStart);
  snowflake::ZeroSequenceSeed seed;
  Snowflake generator(SnowflakeOptions{kEpochSeconds, 1, 1}, clock, seed);

  std::set<std::uint64_t> seen;
  for (std::int64_t i = 0; i <= snowflake::kMaxSequence; ++i) {
    const std::uint64_t id = generator.next();
    const auto parsed = generator.parse(id);
    REQUIRE(parsed.timestamp == 5'000);
    REQUIRE(parsed.sequence == i);
    seen.insert(id);
  }
  CHECK(seen.size() == 4096);
  CHECK(clock.total_slept_millis() == 0);

  const auto rolled = generator.parse(generator.next());
  CHECK(rolled.timestamp == 5'001);
  CHECK(rolled.sequence == 0);
  CHECK(clock.total_slept_millis() == 1);
}

TEST_CASE("next: a high seeded sequence leaves fewer IDs in its millisecond",
          "[snowflake][sequence]") {
  core::ManualClock clock(kStart);
  FixedSequenceSeed seed(4090);
  Snowflake generator(SnowflakeOptions{kEpochSeconds, 1, 1}, clock, seed);

  for (std::int64_t expected = 4090; expected <= snowflake::kMaxSequence; ++expected) {
    const auto parsed = generator.parse(generator.next());
    REQUIRE(parsed.timestamp == 5'000);
    REQUIRE(parsed.sequence == expected);
  }

  const auto rolled = generator.parse(generator.next());
  CHECK(rolled.timestamp == 5'001);
  CHECK(rolled.sequence == 4090);
}

TEST_CASE("next: an exhausted millisecond on a stalled clock never reissues a sequence",
          "[snowflake][sequence]") {
  testing::ScriptedClock clock({kStart});
  snowflake::ZeroSequenceSeed seed;
  Snowflake generator(SnowflakeOptions{kEpochSeconds, 1, 1}, clock, seed);

  for (std::int64_t i = 0; i <= snowflake::kMaxSequence; ++i) {
    (void)generator.next();
  }

  // The clock never advances, so waiting can only end in an error.
  CHECK_THROWS_AS(generator.next(), snowflake::ClockRegressionError);
  CHECK(clock.total_slept_millis() == snowflake::kClockRegressionTimeoutMillis);

  // Once the clock moves on, generation resumes in the new millisecond.
  clock.then({kStart + 1});
  const auto parsed = generator.parse(generator.next());
  CHECK(parsed.timestamp == 5'001);
  CHECK(parsed.sequence == 0);
}
