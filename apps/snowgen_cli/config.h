#pragma once

#include "snowgen/core/result.h"
#include "snowgen/snowflake/snowflake.h"

#include "shared/arg_parser.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace snowgen::cli {

// SequenceStart selects the ISequenceSeed a command's generator uses.
// kRandom: uniformly random start each millisecond (default)
// kZero:   start every millisecond at 0
enum class SequenceStart {
  kRandom,  // NOLINT(readability-identifier-naming)
  kZero,    // NOLINT(readability-identifier-naming)
};

// CliConfig holds generator settings and per-command arguments.
// Environment variables supply the initial values; flags override them.
struct CliConfig {
  std::optional<std::int64_t> epoch_seconds;                 // NOLINT(readability-identifier-naming)
  std::int64_t worker_id{1};                                 // NOLINT(readability-identifier-naming)
  std::int64_t datacenter_id{1};                             // NOLINT(readability-identifier-naming)
  SequenceStart sequence_start{SequenceStart::kRandom};      // NOLINT(readability-identifier-naming)
  std::int64_t count{1};                                     // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> encode_timestamp;              // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> encode_sequence;               // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;                      // NOLINT(readability-identifier-naming)
};

// EnvLookup returns the value of an environment variable, or nullopt if unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// process_env reads the real process environment via std::getenv.
[[nodiscard]] EnvLookup process_env();

// config_from_env builds the starting config from:
//   SNOWGEN_WORKER_ID, SNOWGEN_DATACENTER_ID, SNOWGEN_EPOCH (Unix seconds),
//   SNOWGEN_SEQUENCE_START (random|zero).
// Unset variables keep their defaults. A set but malformed variable is an error.
[[nodiscard]] core::Result<CliConfig, std::string> config_from_env(const EnvLookup& env);

// option_registry lists every flag snowgen_cli accepts.
[[nodiscard]] std::vector<apps::Option<CliConfig>> option_registry();

// parse_cli_args parses argv[start..] over `defaults` (usually the env config).
[[nodiscard]] core::Result<CliConfig, std::string> parse_cli_args(
    int argc, char* argv[], int start, CliConfig defaults);  // NOLINT(modernize-avoid-c-arrays)

// usage_text is the full help screen: commands, options, and the note that
// generator settings are validated for every command that builds a generator.
[[nodiscard]] std::string usage_text();

// to_snowflake_options extracts the generator settings.
[[nodiscard]] snowflake::SnowflakeOptions to_snowflake_options(const CliConfig& config);

}  // namespace snowgen::cli
