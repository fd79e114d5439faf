#pragma once

#include <cstdint>

namespace snowgen::core {

// Abstract clock interface for timestamp and suspension injection.
// Production code reads the system clock; tests drive a ManualClock so that
// clock regressions and sequence exhaustion can be reproduced exactly.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current wall-clock time in whole milliseconds since the Unix epoch.
  virtual std::int64_t now_unix_millis() = 0;

  // Suspend the calling thread for the given number of milliseconds.
  // Contract: millis >= 0.
  virtual void sleep_for_millis(std::int64_t millis) = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: std::chrono::system_clock and a real thread sleep.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_unix_millis() override;
  void sleep_for_millis(std::int64_t millis) override;
};

// Manual clock: time only moves when told to.
// sleep_for_millis() advances the clock instead of blocking, so a waiting
// generator observes time passing without the test paying for it.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::int64_t start_millis) : now_millis_(start_millis) {}
  ~ManualClock() override = default;

  ManualClock(const ManualClock&) = default;
  ManualClock& operator=(const ManualClock&) = default;
  ManualClock(ManualClock&&) = default;
  ManualClock& operator=(ManualClock&&) = default;

  std::int64_t now_unix_millis() override;
  void sleep_for_millis(std::int64_t millis) override;

  void set(std::int64_t millis) { now_millis_ = millis; }
  void advance(std::int64_t millis) { now_millis_ += millis; }

  // Sum of all sleep_for_millis() requests since construction.
  [[nodiscard]] std::int64_t total_slept_millis() const { return total_slept_millis_; }

 private:
  std::int64_t now_millis_;
  std::int64_t total_slept_millis_{0};
};

// Process-wide SystemClock shared by generators constructed without an explicit clock.
// SystemClock is stateless, so sharing it across threads is safe.
IClock& system_clock();

}  // namespace snowgen::core
