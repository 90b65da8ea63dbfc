#pragma once

#include "sfid/core/result.h"
#include "sfid/core/time.h"

#include <compare>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace sfid::core {

// Bit layout of a snowflake, most significant bit first:
//
//   63     | 62 ........................ 22 | 21        | 20 ........... 0
//   sign=0 | milliseconds since kEpoch (41) | separator | random (21 bits)
//
// Generated values always have the sign and separator bits cleared.
inline constexpr unsigned kSignBit = 63;
inline constexpr unsigned kTimestampBits = 41;
inline constexpr unsigned kTimestampShift = 22;
inline constexpr std::uint64_t kTimestampMask = 0x01FF'FFFF'FFFF;
inline constexpr unsigned kSeparatorBit = 21;
inline constexpr unsigned kRandomBits = 21;
inline constexpr std::uint64_t kRandomMax = 0x001F'FFFF;

// Snowflake is an immutable 64-bit identifier value.
//
// Construction from a raw integer is a transparent wrap: no masking and no
// layout validation. Values read back from storage or received from other
// systems round-trip bit for bit, including ones with bit 63 or bit 21 set.
// Use has_generated_layout() when a caller depends on the generator's invariants.
//
// There is deliberately no default constructor; fresh values come from the
// generator (see sfid/core/id_generator.h).
class Snowflake {
 public:
  constexpr explicit Snowflake(const std::uint64_t value) : value_(value) {}

  static constexpr Snowflake from_u64(const std::uint64_t value) { return Snowflake(value); }

  [[nodiscard]] constexpr std::uint64_t as_u64() const { return value_; }

  // Milliseconds since kEpochUnixMillis stored in bits 62-22.
  [[nodiscard]] constexpr std::uint64_t timestamp_millis() const {
    return (value_ >> kTimestampShift) & kTimestampMask;
  }

  [[nodiscard]] constexpr std::uint64_t random_part() const { return value_ & kRandomMax; }

  [[nodiscard]] constexpr bool separator_bit() const { return ((value_ >> kSeparatorBit) & 1U) != 0; }

  [[nodiscard]] constexpr bool sign_bit() const { return ((value_ >> kSignBit) & 1U) != 0; }

  // True iff the sign and separator bits are both clear.
  [[nodiscard]] constexpr bool has_generated_layout() const {
    return !sign_bit() && !separator_bit();
  }

  [[nodiscard]] std::int64_t unix_millis() const {
    return static_cast<std::int64_t>(timestamp_millis()) + kEpochUnixMillis.count();
  }

  [[nodiscard]] Timestamp created_at() const { return from_unix_millis(unix_millis()); }

  constexpr auto operator<=>(const Snowflake&) const = default;

 private:
  std::uint64_t value_;
};

// Decimal rendering of the raw value.
[[nodiscard]] std::string to_string(Snowflake id);

// "0x" followed by 16 lower-case hex digits.
[[nodiscard]] std::string to_hex_string(Snowflake id);

// parse_snowflake accepts a decimal or "0x"-prefixed hexadecimal raw value.
// Any 64-bit value is accepted; the layout is not validated.
[[nodiscard]] Result<Snowflake, ParseError> parse_snowflake(std::string_view text);

}  // namespace sfid::core

namespace std {

template <>
struct hash<sfid::core::Snowflake> {
  size_t operator()(const sfid::core::Snowflake& id) const noexcept {
    return hash<uint64_t>{}(id.as_u64());
  }
};

}  // namespace std
