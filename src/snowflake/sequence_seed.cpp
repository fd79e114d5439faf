#include "snowgen/snowflake/sequence_seed.h"

#include "snowgen/snowflake/layout.h"

#include <random>

namespace snowgen::snowflake {

std::int64_t RandomSequenceSeed::initial_sequence() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::int64_t> dist(0, kMaxSequence);
  return dist(rng);
}

ISequenceSeed& random_sequence_seed() {
  static RandomSequenceSeed seed;
  return seed;
}

}  // namespace snowgen::snowflake
