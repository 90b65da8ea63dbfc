#include "sfid/core/timestamp.h"

#include <chrono>
#include <limits>
#include <utility>

namespace sfid::core {

static_assert(pack_timestamp(kTimestampMask) == (kTimestampMask << kTimestampShift));
static_assert((pack_timestamp(kTimestampMask) & kRandomMax) == 0);
static_assert(((pack_timestamp(kTimestampMask) >> kSignBit) & 1U) == 0);

Result<std::uint64_t, SnowflakeError> elapsed_millis(const Timestamp ts) {
  using TimestampResult = Result<std::uint64_t, SnowflakeError>;

  const auto since_unix =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch());
  if (since_unix < kEpochUnixMillis) {
    return TimestampResult::err(SnowflakeError::kEpochOrdering);
  }

  const auto elapsed = (since_unix - kEpochUnixMillis).count();
  if (std::cmp_greater(elapsed, std::numeric_limits<std::uint64_t>::max())) {
    return TimestampResult::err(SnowflakeError::kTimestampOverflow);
  }

  return TimestampResult::ok(static_cast<std::uint64_t>(elapsed));
}

Result<std::uint64_t, SnowflakeError> timestamp_part(const IClock& clock) {
  const auto elapsed = elapsed_millis(clock.now());
  if (!elapsed.has_value()) {
    return elapsed;
  }
  return Result<std::uint64_t, SnowflakeError>::ok(pack_timestamp(elapsed.value()));
}

}  // namespace sfid::core
