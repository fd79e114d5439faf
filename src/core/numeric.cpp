#include "snowgen/core/numeric.h"

#include <charconv>
#include <system_error>

namespace snowgen::core {

namespace {

template <typename T>
std::optional<T> parse_whole(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  T value{};
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<std::int64_t> parse_int64(std::string_view text) {
  return parse_whole<std::int64_t>(text);
}

std::optional<std::uint64_t> parse_uint64(std::string_view text) {
  // from_chars accepts a leading '-' for unsigned types on some libraries; reject it here.
  if (!text.empty() && text.front() == '-') {
    return std::nullopt;
  }
  return parse_whole<std::uint64_t>(text);
}

}  // namespace snowgen::core
