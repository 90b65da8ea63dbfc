#include "sfid/core/clock.h"

namespace sfid::core {

Timestamp SystemClock::now() const { return now_utc(); }

Timestamp FixedClock::now() const { return fixed_time_; }

}  // namespace sfid::core
