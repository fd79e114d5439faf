#include "snowgen/snowflake/errors.h"

namespace snowgen::snowflake {

ClockRegressionError::ClockRegressionError(std::int64_t last_timestamp, std::int64_t timeout_ms)
    : std::runtime_error("[Timeout(" + std::to_string(timeout_ms) +
                         ")] Couldn't generate snowflake id, os time is backwards. [last timestamp:" +
                         std::to_string(last_timestamp) + "]"),
      last_timestamp_(last_timestamp),
      timeout_ms_(timeout_ms) {}

}  // namespace snowgen::snowflake
