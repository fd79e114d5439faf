#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace snowgen::snowflake {

// ParsedSnowflake is the decoded, human-inspectable view of one ID.
//
// binary is the base-2 text of the ID without leading zeros ("0" for zero).
// The binary_* members are slices of that text at the fixed layout offsets,
// counted from the least-significant end. A slice lying wholly above the
// highest set bit is empty; its numeric field is 0.
// timestamp is relative to epoch; datetime renders timestamp + epoch in local time.
struct ParsedSnowflake {
  std::int64_t binary_length{0};     // NOLINT(readability-identifier-naming)
  std::string binary;                // NOLINT(readability-identifier-naming)
  std::string binary_timestamp;      // NOLINT(readability-identifier-naming)
  std::string binary_sequence;       // NOLINT(readability-identifier-naming)
  std::string binary_worker_id;      // NOLINT(readability-identifier-naming)
  std::string binary_datacenter_id;  // NOLINT(readability-identifier-naming)
  std::int64_t timestamp{0};         // NOLINT(readability-identifier-naming)
  std::int64_t sequence{0};          // NOLINT(readability-identifier-naming)
  std::int64_t worker_id{0};         // NOLINT(readability-identifier-naming)
  std::int64_t datacenter_id{0};     // NOLINT(readability-identifier-naming)
  std::int64_t epoch{0};             // NOLINT(readability-identifier-naming)
  std::string datetime;              // NOLINT(readability-identifier-naming)
};

// to_binary_string renders id in base 2 without leading zeros.
[[nodiscard]] std::string to_binary_string(std::uint64_t id);

// parsed_snowflake_to_json converts a ParsedSnowflake to a JSON object whose
// keys are the member names above. Keys are sorted alphabetically.
[[nodiscard]] nlohmann::json parsed_snowflake_to_json(const ParsedSnowflake& parsed);

}  // namespace snowgen::snowflake
