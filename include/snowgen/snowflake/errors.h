#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace snowgen::snowflake {

// ClockRegressionError is raised by next() when the clock has moved backward
// further than the timeout allows, or when one call has already been
// suspended for the whole timeout without the clock catching up.
// It carries the generator's last issued timestamp (Unix ms) and the timeout.
class ClockRegressionError : public std::runtime_error {
 public:
  ClockRegressionError(std::int64_t last_timestamp, std::int64_t timeout_ms);

  [[nodiscard]] std::int64_t last_timestamp() const noexcept { return last_timestamp_; }
  [[nodiscard]] std::int64_t timeout_ms() const noexcept { return timeout_ms_; }

 private:
  std::int64_t last_timestamp_;
  std::int64_t timeout_ms_;
};

// ConfigurationError is raised at construction when a worker or datacenter ID
// does not fit its bit slot.
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& message) : std::invalid_argument(message) {}
};

}  // namespace snowgen::snowflake
