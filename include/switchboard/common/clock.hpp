#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace switchboard::common {

using TimePoint = std::chrono::system_clock::time_point;

/// Wall clock source. Components take one so tests can drive time by hand.
using Clock = std::function<TimePoint()>;

[[nodiscard]] inline Clock system_clock() {
  return [] { return std::chrono::system_clock::now(); };
}

[[nodiscard]] inline std::int64_t to_unix_seconds(const TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline TimePoint from_unix_seconds(const std::int64_t seconds) {
  return TimePoint(std::chrono::seconds(seconds));
}

} // namespace switchboard::common
