#include "startup_guard.h"

#include "snowgen/snowflake/layout.h"

namespace snowgen::cli {

namespace {

std::string check_range(const std::string& name, std::int64_t value, std::int64_t max) {
  if (value < 0 || value > max) {
    return "Error: " + name + " " + std::to_string(value) + " is out of range [0, " +
           std::to_string(max) + "]";
  }
  return "";
}

}  // namespace

std::string validate_cli_config(const CliConfig& config) {
  if (auto error = check_range("--worker-id", config.worker_id, snowflake::kMaxWorkerId);
      !error.empty()) {
    return error;
  }
  if (auto error =
          check_range("--datacenter-id", config.datacenter_id, snowflake::kMaxDatacenterId);
      !error.empty()) {
    return error;
  }

  if (config.epoch_seconds.has_value() && config.epoch_seconds.value() < 0) {
    return "Error: --epoch must not be negative";
  }
  if (config.epoch_seconds.has_value() &&
      config.epoch_seconds.value() > snowflake::kMaxEpochSeconds) {
    return "Error: --epoch " + std::to_string(config.epoch_seconds.value()) +
           " is too large (max " + std::to_string(snowflake::kMaxEpochSeconds) + ")";
  }

  if (config.count < 1) {
    return "Error: --count must be at least 1";
  }

  // The encoder itself is unchecked; the CLI refuses values that would spill.
  if (config.encode_timestamp.has_value()) {
    constexpr std::int64_t kMaxTimestamp = (std::int64_t{1} << snowflake::kTimestampBits) - 1;
    if (auto error = check_range("--timestamp", config.encode_timestamp.value(), kMaxTimestamp);
        !error.empty()) {
      return error;
    }
  }
  if (config.encode_sequence.has_value()) {
    if (auto error =
            check_range("--sequence", config.encode_sequence.value(), snowflake::kMaxSequence);
        !error.empty()) {
      return error;
    }
  }

  return "";
}

}  // namespace snowgen::cli
