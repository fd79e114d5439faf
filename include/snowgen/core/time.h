#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace snowgen::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// default_epoch_seconds returns 2022-04-15 00:00:00 in the process's local
// time zone, as Unix seconds. This is the generator's default zero point.
[[nodiscard]] std::int64_t default_epoch_seconds();

// format_local_datetime renders Unix milliseconds as "YYYY-MM-DD HH:MM:SS" in
// local time. Sub-second precision is floored away.
[[nodiscard]] std::string format_local_datetime(std::int64_t unix_millis);

}  // namespace snowgen::core
