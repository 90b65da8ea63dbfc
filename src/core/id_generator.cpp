#include "sfid/core/id_generator.h"

#include "sfid/core/timestamp.h"

#include <string>

namespace sfid::core {

Result<Snowflake, SnowflakeError> SnowflakeGenerator::next() {
  using SnowflakeResult = Result<Snowflake, SnowflakeError>;

  // Bit 21 stays clear: the draw never exceeds kRandomMax.
  const auto random_part = random_.next_in_range(0, kRandomMax);
  if (!random_part.has_value()) {
    return SnowflakeResult::err(random_part.error());
  }

  const auto timestamp = timestamp_part(clock_);
  if (!timestamp.has_value()) {
    return SnowflakeResult::err(timestamp.error());
  }

  return SnowflakeResult::ok(Snowflake::from_u64(timestamp.value() | random_part.value()));
}

SnowflakeGenerationError::SnowflakeGenerationError(const SnowflakeError code)
    : std::runtime_error("Snowflake generation failed: " + std::string(to_string(code))),
      code_(code) {}

Snowflake random_snowflake() {
  static const SystemClock clock{};
  ThreadLocalRandomSource random;
  SnowflakeGenerator generator(clock, random);

  const auto result = generator.next();
  if (!result.has_value()) {
    throw SnowflakeGenerationError(result.error());
  }
  return result.value();
}

Snowflake default_snowflake() { return random_snowflake(); }

}  // namespace sfid::core
