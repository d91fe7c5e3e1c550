#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace cronhive::util {

using TimePoint = std::chrono::system_clock::time_point;

// YYYY-MM-DDTHH:MM:SSZ
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{})
    return {};
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

// YYYY-MM-DD HH:MM:SS.mmm in UTC, "-" for the epoch sentinel
[[nodiscard]] inline auto format_timestamp_ms(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return "-";
  }
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::milliseconds>(tp));
}

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis) -> TimePoint {
  return TimePoint{std::chrono::milliseconds{millis}};
}

} // namespace cronhive::util
