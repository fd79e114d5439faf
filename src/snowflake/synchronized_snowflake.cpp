#include "snowgen/snowflake/synchronized_snowflake.h"

namespace snowgen::snowflake {

std::uint64_t SynchronizedSnowflake::next() {
  std::lock_guard<std::mutex> lock(mutex_);
  return generator_.next();
}

std::uint64_t SynchronizedSnowflake::short_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  return generator_.short_id();
}

ParsedSnowflake SynchronizedSnowflake::parse(std::uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generator_.parse(id);
}

std::uint64_t SynchronizedSnowflake::to_snowflake_id(std::int64_t relative_timestamp,
                                                     std::int64_t sequence) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generator_.to_snowflake_id(relative_timestamp, sequence);
}

std::int64_t SynchronizedSnowflake::timestamp() {
  std::lock_guard<std::mutex> lock(mutex_);
  return generator_.timestamp();
}

}  // namespace snowgen::snowflake
