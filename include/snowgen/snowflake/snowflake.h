#pragma once

#include "snowgen/core/clock.h"
#include "snowgen/snowflake/parsed_snowflake.h"
#include "snowgen/snowflake/sequence_seed.h"

#include <cstdint>
#include <optional>

namespace snowgen::snowflake {

// SnowflakeOptions configures one generator. Every field has an explicit default.
// epoch_seconds: Unix seconds of the zero point; nullopt means
//   core::default_epoch_seconds() (2022-04-15 00:00:00 local time).
// worker_id, datacenter_id: must each be in [0, 31].
struct SnowflakeOptions {
  std::optional<std::int64_t> epoch_seconds;  // NOLINT(readability-identifier-naming)
  std::int64_t worker_id{1};                  // NOLINT(readability-identifier-naming)
  std::int64_t datacenter_id{1};              // NOLINT(readability-identifier-naming)
};

// Snowflake generates 63-bit, time-ordered IDs without a central coordinator.
//
// IDs from one instance are unique and non-decreasing as long as the clock
// does not step backward by more than kClockRegressionTimeoutMillis.
//
// Thread-safety: NOT thread-safe. next() and short_id() mutate the
// last-timestamp and sequence state without synchronization; concurrent
// calls on one instance can produce duplicate or out-of-order IDs. Use one
// instance per thread, or share a SynchronizedSnowflake.
//
// Suspension: next() may block the calling thread (through IClock) while a
// small clock regression or an exhausted millisecond passes, for at most
// kClockRegressionTimeoutMillis in total per call. There is no cancellation.
//
// The clock and sequence seed are borrowed, not owned; they must outlive the
// generator.
class Snowflake {
 public:
  // Uses the process-wide system clock and random sequence seed.
  // Throws ConfigurationError if worker_id or datacenter_id is out of range,
  // or if epoch_seconds overflows when converted to milliseconds.
  explicit Snowflake(SnowflakeOptions options = {});

  // Throws ConfigurationError under the same conditions as above.
  Snowflake(SnowflakeOptions options, core::IClock& clock, ISequenceSeed& sequence_seed);

  ~Snowflake() = default;

  // Not copyable or movable: two live copies would issue the same IDs.
  Snowflake(const Snowflake&) = delete;
  Snowflake& operator=(const Snowflake&) = delete;
  Snowflake(Snowflake&&) = delete;
  Snowflake& operator=(Snowflake&&) = delete;

  // Issue the next ID.
  // Throws ClockRegressionError when the clock is behind the last issued
  // timestamp by more than the timeout, or when this call has already spent
  // the whole timeout suspended.
  [[nodiscard]] std::uint64_t next();

  // Pack a relative timestamp and sequence with this instance's worker and
  // datacenter IDs. Unchecked: out-of-width values corrupt adjacent fields.
  [[nodiscard]] std::uint64_t to_snowflake_id(std::int64_t relative_timestamp,
                                              std::int64_t sequence) const;

  // Decode an ID issued under the same epoch. Never throws; IDs from another
  // epoch or layout decode to meaningless values.
  [[nodiscard]] ParsedSnowflake parse(std::uint64_t id) const;

  // Issue a 53-bit ID: relative timestamp and sequence only.
  // IDs from different workers can collide.
  // Throws ClockRegressionError under the same conditions as next().
  [[nodiscard]] std::uint64_t short_id();

  // Current clock reading in Unix milliseconds.
  [[nodiscard]] std::int64_t timestamp();

  [[nodiscard]] std::int64_t epoch() const { return epoch_; }
  [[nodiscard]] std::int64_t worker_id() const { return worker_id_; }
  [[nodiscard]] std::int64_t datacenter_id() const { return datacenter_id_; }
  [[nodiscard]] std::int64_t last_timestamp() const { return last_timestamp_; }
  [[nodiscard]] std::int64_t sequence() const { return sequence_; }

 private:
  core::IClock* clock_;
  ISequenceSeed* sequence_seed_;
  std::int64_t epoch_;
  std::int64_t worker_id_;
  std::int64_t datacenter_id_;
  std::int64_t last_timestamp_;
  std::int64_t sequence_{0};
};

}  // namespace snowgen::snowflake
