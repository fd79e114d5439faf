#pragma once

#include "snowgen/core/clock.h"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace snowgen::testing {

// ScriptedClock replays a fixed list of readings, one per now_unix_millis()
// call, then repeats the last reading forever. Sleeping does not move time;
// each requested sleep is recorded instead.
// Precondition: the script is non-empty; an empty one throws std::invalid_argument.
class ScriptedClock final : public core::IClock {
 public:
  explicit ScriptedClock(std::vector<std::int64_t> readings) : readings_(std::move(readings)) {
    if (readings_.empty()) {
      throw std::invalid_argument("ScriptedClock requires at least one reading");
    }
  }

  std::int64_t now_unix_millis() override {
    const std::int64_t value = readings_.at(next_ < readings_.size() ? next_ : readings_.size() - 1);
    if (next_ < readings_.size()) {
      ++next_;
    }
    return value;
  }

  void sleep_for_millis(std::int64_t millis) override { sleeps_.push_back(millis); }

  // Append more readings after the current script.
  void then(std::vector<std::int64_t> readings) {
    if (readings.empty()) {
      throw std::invalid_argument("ScriptedClock::then requires at least one reading");
    }
    if (next_ >= readings_.size()) {
      // Script exhausted: drop everything already consumed so new readings come next.
      readings_.clear();
      next_ = 0;
    }
    readings_.insert(readings_.end(), readings.begin(), readings.end());
  }

  [[nodiscard]] const std::vector<std::int64_t>& sleeps() const { return sleeps_; }

  [[nodiscard]] std::int64_t total_slept_millis() const {
    std::int64_t total = 0;
    for (const auto s : sleeps_) {
      total += s;
    }
    return total;
  }

 private:
  std::vector<std::int64_t> readings_;
  std::size_t next_{0};
  std::vector<std::int64_t> sleeps_;
};

}  // namespace snowgen::testing
