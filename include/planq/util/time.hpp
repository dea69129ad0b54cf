#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace planq {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

} // namespace planq

namespace planq::util {

// Formats time point to ISO 8601 with milliseconds (YYYY-MM-DDTHH:MM:SS.mmmZ)
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return {};
  }
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::milliseconds>(tp));
}

[[nodiscard]] inline auto format_local_timestamp(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return "-";
  }
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis) -> TimePoint {
  return TimePoint{std::chrono::milliseconds{millis}};
}

[[nodiscard]] inline auto now_millis() -> std::int64_t {
  return to_unix_millis(Clock::now());
}

} // namespace planq::util
