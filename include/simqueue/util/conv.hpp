#pragma once

#include "simqueue/core/error.hpp"

#include <charconv>
#include <concepts>
#include <string_view>

namespace simqueue::util {

/// Whole-string integer parse; ParseError on trailing characters,
/// overflow or an empty input.
template <std::integral T>
[[nodiscard]] inline auto parse_int(std::string_view s, int base = 10)
    -> Result<T> {
  T value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, base);
  if (ec == std::errc{} && ptr == s.data() + s.size() && !s.empty()) {
    return ok(value);
  }
  return fail(Error::ParseError);
}

} // namespace simqueue::util
