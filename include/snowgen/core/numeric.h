#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace snowgen::core {

// parse_int64 / parse_uint64 parse a complete base-10 integer.
// Returns nullopt for empty input, trailing characters, or out-of-range values.
// No leading '+' and no surrounding whitespace are accepted.
[[nodiscard]] std::optional<std::int64_t> parse_int64(std::string_view text);
[[nodiscard]] std::optional<std::uint64_t> parse_uint64(std::string_view text);

}  // namespace snowgen::core
