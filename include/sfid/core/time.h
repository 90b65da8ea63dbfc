#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sfid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Custom epoch of the identifier timestamp field: 2019-01-01T00:00:00Z.
inline constexpr std::chrono::milliseconds kEpochUnixMillis{1'546'300'800'000};

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{millis})};
}

// format_iso8601 renders ts in UTC with millisecond precision,
// e.g. "2019-01-01T00:00:00.000Z". Throws std::out_of_range if ts has no
// calendar representation.
[[nodiscard]] std::string format_iso8601(Timestamp ts);

}  // namespace sfid::core
