#pragma once

#include "sfid/core/clock.h"
#include "sfid/core/random_source.h"
#include "sfid/core/result.h"
#include "sfid/core/snowflake.h"

#include <stdexcept>

namespace sfid::core {

// Abstract snowflake generator interface for dependency injection.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class ISnowflakeGenerator {
 public:
  virtual ~ISnowflakeGenerator() = default;

  // Generate a fresh identifier.
  // Contract: on success bit 63 and bit 21 are zero, bits 62-22 hold the
  // current timestamp field and bits 20-0 a uniformly drawn random value.
  [[nodiscard]] virtual Result<Snowflake, SnowflakeError> next() = 0;

 protected:
  ISnowflakeGenerator() = default;
  ISnowflakeGenerator(const ISnowflakeGenerator&) = default;
  ISnowflakeGenerator& operator=(const ISnowflakeGenerator&) = default;
  ISnowflakeGenerator(ISnowflakeGenerator&&) = default;
  ISnowflakeGenerator& operator=(ISnowflakeGenerator&&) = default;
};

// SnowflakeGenerator combines an injected clock and random source.
// It holds references (not ownership); both must outlive the generator.
// Thread-safe whenever the clock and random source are.
class SnowflakeGenerator final : public ISnowflakeGenerator {
 public:
  SnowflakeGenerator(const IClock& clock, IRandomSource& random)
      : clock_(clock), random_(random) {}
  ~SnowflakeGenerator() override = default;

  // Not copyable or movable (reference members)
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  [[nodiscard]] Result<Snowflake, SnowflakeError> next() override;

 private:
  const IClock& clock_;
  IRandomSource& random_;
};

// Thrown by the convenience functions below, which have no error channel.
class SnowflakeGenerationError : public std::runtime_error {
 public:
  explicit SnowflakeGenerationError(SnowflakeError code);

  [[nodiscard]] SnowflakeError code() const { return code_; }

 private:
  SnowflakeError code_;
};

// random_snowflake generates from the system clock and the calling thread's
// ThreadLocalRandomSource. Throws SnowflakeGenerationError on failure.
[[nodiscard]] Snowflake random_snowflake();

// default_snowflake is an alias for random_snowflake().
[[nodiscard]] Snowflake default_snowflake();

}  // namespace sfid::core
