#include "config.h"

#include "snowgen/core/numeric.h"

#include <cstdlib>
#include <utility>

namespace snowgen::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Value Parsers
// ────────────────────────────────────────────────────────────────

std::string parse_int_into(std::int64_t& target, const std::string& name,
                           const std::string& value) {
  const auto parsed = core::parse_int64(value);
  if (!parsed.has_value()) {
    return "Invalid " + name + ": '" + value + "' is not an integer";
  }
  target = parsed.value();
  return "";
}

std::string parse_optional_int_into(std::optional<std::int64_t>& target, const std::string& name,
                                    const std::string& value) {
  std::int64_t parsed = 0;
  auto error = parse_int_into(parsed, name, value);
  if (error.empty()) {
    target = parsed;
  }
  return error;
}

std::string parse_sequence_start(SequenceStart& target, const std::string& name,
                                 const std::string& value) {
  if (value == "random") {
    target = SequenceStart::kRandom;
    return "";
  }
  if (value == "zero") {
    target = SequenceStart::kZero;
    return "";
  }
  return "Invalid " + name + ": " + value + " (valid: random, zero)";
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

std::string handle_worker_id(CliConfig& config, const std::string& value) {
  return parse_int_into(config.worker_id, "--worker-id", value);
}

std::string handle_datacenter_id(CliConfig& config, const std::string& value) {
  return parse_int_into(config.datacenter_id, "--datacenter-id", value);
}

std::string handle_epoch(CliConfig& config, const std::string& value) {
  return parse_optional_int_into(config.epoch_seconds, "--epoch", value);
}

std::string handle_sequence_start(CliConfig& config, const std::string& value) {
  return parse_sequence_start(config.sequence_start, "--sequence-start", value);
}

std::string handle_count(CliConfig& config, const std::string& value) {
  return parse_int_into(config.count, "--count", value);
}

std::string handle_timestamp(CliConfig& config, const std::string& value) {
  return parse_optional_int_into(config.encode_timestamp, "--timestamp", value);
}

std::string handle_sequence(CliConfig& config, const std::string& value) {
  return parse_optional_int_into(config.encode_sequence, "--sequence", value);
}

}  // namespace

EnvLookup process_env() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());  // NOLINT(concurrency-mt-unsafe)
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

core::Result<CliConfig, std::string> config_from_env(const EnvLookup& env) {
  CliConfig config;
  std::string error;

  if (const auto value = env("SNOWGEN_WORKER_ID")) {
    error = parse_int_into(config.worker_id, "SNOWGEN_WORKER_ID", *value);
  }
  if (error.empty()) {
    if (const auto value = env("SNOWGEN_DATACENTER_ID")) {
      error = parse_int_into(config.datacenter_id, "SNOWGEN_DATACENTER_ID", *value);
    }
  }
  if (error.empty()) {
    if (const auto value = env("SNOWGEN_EPOCH")) {
      error = parse_optional_int_into(config.epoch_seconds, "SNOWGEN_EPOCH", *value);
    }
  }
  if (error.empty()) {
    if (const auto value = env("SNOWGEN_SEQUENCE_START")) {
      error = parse_sequence_start(config.sequence_start, "SNOWGEN_SEQUENCE_START", *value);
    }
  }

  if (!error.empty()) {
    return core::Result<CliConfig, std::string>::err(error);
  }
  return core::Result<CliConfig, std::string>::ok(std::move(config));
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliConfig>> option_registry() {
  return {
      {"--worker-id", true, "Worker ID, 0-31 (env SNOWGEN_WORKER_ID)", handle_worker_id},
      {"--datacenter-id", true, "Datacenter ID, 0-31 (env SNOWGEN_DATACENTER_ID)",
       handle_datacenter_id},
      {"--epoch", true, "Epoch in Unix seconds (env SNOWGEN_EPOCH)", handle_epoch},
      {"--sequence-start", true, "Sequence start per millisecond (random|zero)",
       handle_sequence_start},
      {"--count", true, "Number of IDs to generate (next, short)", handle_count},
      {"--timestamp", true, "Relative timestamp in ms (encode)", handle_timestamp},
      {"--sequence", true, "Sequence number (encode)", handle_sequence},
  };
}

core::Result<CliConfig, std::string> parse_cli_args(int argc, char* argv[], int start,
                                                    CliConfig defaults) {
  const auto options = option_registry();
  auto parsed = apps::parse_options(argc, argv, options, start, std::move(defaults));
  if (!parsed.has_value()) {
    return core::Result<CliConfig, std::string>::err(parsed.error());
  }

  CliConfig config = parsed.value().config;
  config.positionals = parsed.value().positionals;
  return core::Result<CliConfig, std::string>::ok(std::move(config));
}

std::string usage_text() {
  return "Usage: snowgen_cli <command> [options]\n"
         "\n"
         "Commands:\n"
         "  next        Generate snowflake IDs\n"
         "  short       Generate 53-bit short IDs\n"
         "  parse <id>  Decode an ID and print it as JSON\n"
         "  encode      Pack --timestamp and --sequence into an ID\n"
         "  timestamp   Print the current Unix time in milliseconds\n"
         "  version     Print the build version\n"
         "\n"
         "Options:\n" +
         apps::format_option_help(option_registry()) +
         "\n"
         "Every command except version and help builds a generator, so worker ID,\n"
         "datacenter ID and epoch (from flags or SNOWGEN_* variables) are validated\n"
         "even for parse, encode and timestamp.\n";
}

snowflake::SnowflakeOptions to_snowflake_options(const CliConfig& config) {
  snowflake::SnowflakeOptions options;
  options.epoch_seconds = config.epoch_seconds;
  options.worker_id = config.worker_id;
  options.datacenter_id = config.datacenter_id;
  return options;
}

}  // namespace snowgen::cli
