#pragma once

#include "sfid/core/clock.h"
#include "sfid/core/result.h"
#include "sfid/core/snowflake.h"
#include "sfid/core/time.h"

#include <cstdint>

namespace sfid::core {

// elapsed_millis returns the milliseconds between kEpochUnixMillis and ts.
// Errors:
// - kEpochOrdering: ts is strictly earlier than the epoch (broken or skewed clock)
// - kTimestampOverflow: the elapsed count does not fit in std::uint64_t
[[nodiscard]] Result<std::uint64_t, SnowflakeError> elapsed_millis(Timestamp ts);

// pack_timestamp keeps the low 41 bits of elapsed and moves them to bits 62-22.
// Every other bit of the result is zero.
[[nodiscard]] constexpr std::uint64_t pack_timestamp(const std::uint64_t elapsed) {
  return (elapsed & kTimestampMask) << kTimestampShift;
}

// timestamp_part reads clock once and returns the positioned timestamp field.
[[nodiscard]] Result<std::uint64_t, SnowflakeError> timestamp_part(const IClock& clock);

}  // namespace sfid::core
