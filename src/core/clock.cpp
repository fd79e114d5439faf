#include "snowgen/core/clock.h"

#include "snowgen/core/time.h"

#include <chrono>
#include <thread>

namespace snowgen::core {

std::int64_t SystemClock::now_unix_millis() {
  return to_unix_millis(now_utc());
}

void SystemClock::sleep_for_millis(std::int64_t millis) {
  if (millis <= 0) {
    return;
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(millis));
}

std::int64_t ManualClock::now_unix_millis() {
  return now_millis_;
}

void ManualClock::sleep_for_millis(std::int64_t millis) {
  if (millis <= 0) {
    return;
  }
  now_millis_ += millis;
  total_slept_millis_ += millis;
}

IClock& system_clock() {
  static SystemClock clock;
  return clock;
}

}  // namespace snowgen::core
