#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>

namespace simqueue::util {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/// Current wall-clock time truncated to the millisecond resolution used by
/// every persisted timestamp.
[[nodiscard]] inline auto now_millis() -> Timestamp {
  return std::chrono::floor<std::chrono::milliseconds>(Clock::now());
}

[[nodiscard]] inline auto to_unix_millis(Timestamp tp) -> std::int64_t {
  return tp.time_since_epoch().count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis) -> Timestamp {
  return Timestamp{std::chrono::milliseconds{millis}};
}

// YYYY-MM-DDTHH:MM:SS.mmmZ
[[nodiscard]] inline auto format_iso8601(Timestamp tp) -> std::string {
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", tp);
}

[[nodiscard]] inline auto format_local_timestamp(Timestamp tp)
    -> std::string {
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto
format_local_timestamp(const std::optional<Timestamp> &tp) -> std::string {
  return tp ? format_local_timestamp(*tp) : std::string{"-"};
}

} // namespace simqueue::util
