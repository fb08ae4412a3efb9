#pragma once

#include "simqueue/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace simqueue {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

/// Pre-serialised JSON spliced verbatim into glaze output.
using RawJson = glz::raw_json;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto is_valid_json(std::string_view input) -> bool {
  return parse_json(input).has_value();
}

/// Blank text or a literal `null`.
[[nodiscard]] inline auto is_null_json(std::string_view input) -> bool {
  const auto first = input.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return true;
  }
  const auto last = input.find_last_not_of(" \t\r\n");
  return input.substr(first, last - first + 1) == "null";
}

} // namespace simqueue
