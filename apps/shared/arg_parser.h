#pragma once

#include "snowgen/core/result.h"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace snowgen::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns an empty string on success, or a message describing why the
// value was rejected.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<std::string(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedArgs is the outcome of a successful parse: the populated config plus
// every non-flag token, in order.
template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised
// flag to its handler. Non-flag tokens are collected as positionals.
// The first unknown flag, missing value, or rejected value ends the parse
// with an error message.
template <typename Config>
core::Result<ParsedArgs<Config>, std::string> parse_options(
    int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
    const std::vector<Option<Config>>& options, int start = 1, Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      // A lone "-" or a negative-looking number is not a flag.
      if (arg.size() > 1 && arg[0] == '-' && (arg[1] < '0' || arg[1] > '9')) {
        return core::Result<ParsedArgs<Config>, std::string>::err("Unknown option: " + arg);
      }
      parsed.positionals.push_back(arg);
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        return core::Result<ParsedArgs<Config>, std::string>::err("Option " + arg +
                                                                  " requires a value");
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    const std::string error = opt->handler(parsed.config, value);
    if (!error.empty()) {
      return core::Result<ParsedArgs<Config>, std::string>::err(error);
    }
  }

  return core::Result<ParsedArgs<Config>, std::string>::ok(std::move(parsed));
}

// format_option_help renders one "  --name <value>  description" line per option.
template <typename Config>
std::string format_option_help(const std::vector<Option<Config>>& options) {
  std::string out;
  for (const auto& opt : options) {
    std::string flag = "  " + opt.name + (opt.requires_value ? " <value>" : "");
    if (flag.size() < 28) {
      flag.append(28 - flag.size(), ' ');
    } else {
      flag += "  ";
    }
    out += flag + opt.description + "\n";
  }
  return out;
}

}  // namespace snowgen::apps
