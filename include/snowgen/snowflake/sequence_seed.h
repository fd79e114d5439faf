#pragma once

#include <cstdint>

namespace snowgen::snowflake {

// Source of the first sequence value used when a generator enters a new millisecond.
// Production code randomizes it so consecutive IDs are harder to predict;
// tests and capacity-sensitive callers start from zero.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class ISequenceSeed {
 public:
  virtual ~ISequenceSeed() = default;

  // Contract: returned value is in [0, kMaxSequence].
  virtual std::int64_t initial_sequence() = 0;

 protected:
  ISequenceSeed() = default;
  ISequenceSeed(const ISequenceSeed&) = default;
  ISequenceSeed& operator=(const ISequenceSeed&) = default;
  ISequenceSeed(ISequenceSeed&&) = default;
  ISequenceSeed& operator=(ISequenceSeed&&) = default;
};

// Uniformly random start in [0, kMaxSequence].
// Thread-safe: each thread draws from its own std::mt19937_64.
class RandomSequenceSeed final : public ISequenceSeed {
 public:
  RandomSequenceSeed() = default;
  ~RandomSequenceSeed() override = default;

  RandomSequenceSeed(const RandomSequenceSeed&) = default;
  RandomSequenceSeed& operator=(const RandomSequenceSeed&) = default;
  RandomSequenceSeed(RandomSequenceSeed&&) = default;
  RandomSequenceSeed& operator=(RandomSequenceSeed&&) = default;

  std::int64_t initial_sequence() override;
};

// Always starts at 0. Leaves the full 4096 IDs available in every millisecond,
// and makes generated IDs reproducible under a ManualClock.
class ZeroSequenceSeed final : public ISequenceSeed {
 public:
  ZeroSequenceSeed() = default;
  ~ZeroSequenceSeed() override = default;

  ZeroSequenceSeed(const ZeroSequenceSeed&) = default;
  ZeroSequenceSeed& operator=(const ZeroSequenceSeed&) = default;
  ZeroSequenceSeed(ZeroSequenceSeed&&) = default;
  ZeroSequenceSeed& operator=(ZeroSequenceSeed&&) = default;

  std::int64_t initial_sequence() override { return 0; }
};

// Process-wide RandomSequenceSeed used when no seed is injected.
ISequenceSeed& random_sequence_seed();

}  // namespace snowgen::snowflake
