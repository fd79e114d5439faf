#pragma once

#include "snowgen/snowflake/snowflake.h"

#include <cstdint>
#include <mutex>

namespace snowgen::snowflake {

// SynchronizedSnowflake serializes every call to an owned Snowflake behind one mutex.
//
// Thread-safety: all operations lock (coarse-grained), so one instance may be
// shared freely across threads. A thread waiting out a clock regression inside
// next() holds the lock, so other callers block for up to the same timeout.
class SynchronizedSnowflake {
 public:
  explicit SynchronizedSnowflake(SnowflakeOptions options = {}) : generator_(options) {}
  SynchronizedSnowflake(SnowflakeOptions options, core::IClock& clock,
                        ISequenceSeed& sequence_seed)
      : generator_(options, clock, sequence_seed) {}
  ~SynchronizedSnowflake() = default;

  // Disable copy/move (mutex not copyable)
  SynchronizedSnowflake(const SynchronizedSnowflake&) = delete;
  SynchronizedSnowflake& operator=(const SynchronizedSnowflake&) = delete;
  SynchronizedSnowflake(SynchronizedSnowflake&&) = delete;
  SynchronizedSnowflake& operator=(SynchronizedSnowflake&&) = delete;

  [[nodiscard]] std::uint64_t next();
  [[nodiscard]] std::uint64_t short_id();
  [[nodiscard]] ParsedSnowflake parse(std::uint64_t id) const;
  [[nodiscard]] std::uint64_t to_snowflake_id(std::int64_t relative_timestamp,
                                              std::int64_t sequence) const;
  [[nodiscard]] std::int64_t timestamp();

 private:
  mutable std::mutex mutex_;
  Snowflake generator_;
};

}  // namespace snowgen::snowflake
