#pragma once

#include "config.h"

#include <string>

namespace snowgen::cli {

// validate_cli_config checks generator preconditions before any generator is built.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - worker_id and datacenter_id are each in [0, 31]
// - epoch_seconds, when set, is not negative and fits in milliseconds
// - count is at least 1
// - encode_timestamp, when set, fits the 41-bit timestamp slot
// - encode_sequence, when set, is in [0, 4095]
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

}  // namespace snowgen::cli
