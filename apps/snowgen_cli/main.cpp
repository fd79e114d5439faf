#include "snowgen/core/clock.h"
#include "snowgen/core/version.h"
#include "snowgen/snowflake/errors.h"
#include "snowgen/snowflake/sequence_seed.h"
#include "snowgen/snowflake/snowflake.h"

#include "commands/generate_logic.h"
#include "commands/inspect_logic.h"
#include "config.h"
#include "startup_guard.h"

#include <iostream>
#include <optional>
#include <string>

namespace {

void print_usage() {
  std::cerr << snowgen::cli::usage_text();
}

// Environment first, then flags; print the first problem and return nullopt.
std::optional<snowgen::cli::CliConfig> load_config(int argc, char* argv[]) {  // NOLINT
  auto env_result = snowgen::cli::config_from_env(snowgen::cli::process_env());
  if (!env_result.has_value()) {
    std::cerr << "Error: " << env_result.error() << "\n";
    return std::nullopt;
  }

  auto args_result = snowgen::cli::parse_cli_args(argc, argv, 2, env_result.value());
  if (!args_result.has_value()) {
    std::cerr << "Error: " << args_result.error() << "\n";
    return std::nullopt;
  }

  const auto& config = args_result.value();
  const auto error = snowgen::cli::validate_cli_config(config);
  if (!error.empty()) {
    std::cerr << error << "\n";
    return std::nullopt;
  }
  return config;
}

int run_command(const std::string& command, const snowgen::cli::CliConfig& config) {
  snowgen::snowflake::RandomSequenceSeed random_seed;
  snowgen::snowflake::ZeroSequenceSeed zero_seed;
  snowgen::snowflake::ISequenceSeed& seed =
      config.sequence_start == snowgen::cli::SequenceStart::kZero
          ? static_cast<snowgen::snowflake::ISequenceSeed&>(zero_seed)
          : static_cast<snowgen::snowflake::ISequenceSeed&>(random_seed);

  snowgen::core::SystemClock clock;
  snowgen::snowflake::Snowflake generator(snowgen::cli::to_snowflake_options(config), clock, seed);

  if (command == "next") {
    return execute_next(generator, config.count, std::cout, std::cerr);
  }
  if (command == "short") {
    return execute_short(generator, config.count, std::cout, std::cerr);
  }
  if (command == "parse") {
    if (config.positionals.size() != 1) {
      std::cerr << "Usage: snowgen_cli parse <id> [--epoch <seconds>]\n";
      return 1;
    }
    return execute_parse(generator, config.positionals.front(), std::cout, std::cerr);
  }
  if (command == "encode") {
    if (!config.encode_timestamp.has_value() || !config.encode_sequence.has_value()) {
      std::cerr << "Usage: snowgen_cli encode --timestamp <ms> --sequence <n>\n";
      return 1;
    }
    return execute_encode(generator, config.encode_timestamp.value(),
                          config.encode_sequence.value(), std::cout);
  }
  if (command == "timestamp") {
    return execute_timestamp(generator, std::cout);
  }

  std::cerr << "Unknown command: " << command << "\n";
  print_usage();
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  if (command == "version" || command == "--version") {
    std::cout << "snowgen v" << snowgen::core::kBuildVersion << "\n";
    return 0;
  }
  if (command == "help" || command == "--help") {
    print_usage();
    return 0;
  }

  const auto config = load_config(argc, argv);
  if (!config.has_value()) {
    return 1;
  }

  try {
    return run_command(command, config.value());
  } catch (const snowgen::snowflake::ConfigurationError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
