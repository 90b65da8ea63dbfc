#include "sfid/core/snowflake.h"
#include "sfid/core/time.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <set>
#include <unordered_set>

using namespace sfid;

TEST_CASE("Raw conversion round-trips every bit pattern", "[codec][raw]") {
  SECTION("zero") { CHECK(core::Snowflake::from_u64(0).as_u64() == 0); }

  SECTION("all bits set, no masking applied") {
    constexpr auto kAllOnes = std::numeric_limits<std::uint64_t>::max();
    CHECK(core::Snowflake::from_u64(kAllOnes).as_u64() == kAllOnes);
  }

  SECTION("values violating the generated layout are kept verbatim") {
    const std::uint64_t values[] = {
        0x8000'0000'0000'0000ULL,  // sign bit only
        0x0000'0000'0020'0000ULL,  // separator bit only
        0x8000'0000'0020'0000ULL,
        0x0123'4567'89AB'CDEFULL,
        0xFEDC'BA98'7654'3210ULL,
        1,
    };
    for (const auto value : values) {
      CHECK(core::Snowflake{value}.as_u64() == value);
      CHECK(core::Snowflake::from_u64(value) == core::Snowflake{value});
    }
  }
}

TEST_CASE("Field accessors decode the bit layout", "[codec][layout]") {
  const auto id = core::Snowflake::from_u64((std::uint64_t{123} << 22) | 0x1234);

  CHECK(id.timestamp_millis() == 123);
  CHECK(id.random_part() == 0x1234);
  CHECK_FALSE(id.separator_bit());
  CHECK_FALSE(id.sign_bit());
  CHECK(id.has_generated_layout());
  CHECK(id.unix_millis() == 1'546'300'800'123);
  CHECK(core::to_unix_millis(id.created_at()) == 1'546'300'800'123);

  SECTION("reserved bits are reported but excluded from the fields") {
    const auto raw = core::Snowflake::from_u64(std::numeric_limits<std::uint64_t>::max());
    CHECK(raw.sign_bit());
    CHECK(raw.separator_bit());
    CHECK_FALSE(raw.has_generated_layout());
    CHECK(raw.timestamp_millis() == core::kTimestampMask);
    CHECK(raw.random_part() == core::kRandomMax);
  }

  SECTION("a single reserved bit is enough to break the generated layout") {
    CHECK_FALSE(core::Snowflake{std::uint64_t{1} << core::kSignBit}.has_generated_layout());
    CHECK_FALSE(core::Snowflake{std::uint64_t{1} << core::kSeparatorBit}.has_generated_layout());
  }
}

TEST_CASE("Layout constants partition the 64 bits", "[codec][layout]") {
  STATIC_REQUIRE(1 + core::kTimestampBits + 1 + core::kRandomBits == 64);
  STATIC_REQUIRE(core::kTimestampMask == (std::uint64_t{1} << core::kTimestampBits) - 1);
  STATIC_REQUIRE(core::kRandomMax == (std::uint64_t{1} << core::kRandomBits) - 1);
  STATIC_REQUIRE(core::kTimestampShift == core::kSeparatorBit + 1);
  STATIC_REQUIRE(core::kEpochUnixMillis.count() == 1'546'300'800'000);
}

TEST_CASE("Snowflakes are regular values", "[codec]") {
  const core::Snowflake a{100};
  const core::Snowflake b{200};

  CHECK(a < b);
  CHECK(a != b);
  CHECK(a == core::Snowflake{100});

  std::set<core::Snowflake> ordered{b, a, core::Snowflake{150}};
  CHECK(ordered.begin()->as_u64() == 100);
  CHECK(ordered.rbegin()->as_u64() == 200);

  std::unordered_set<core::Snowflake> ids{a, b, core::Snowflake{100}};
  CHECK(ids.size() == 2);
}

TEST_CASE("Text rendering", "[codec][text]") {
  CHECK(core::to_string(core::Snowflake{0}) == "0");
  CHECK(core::to_string(core::Snowflake{std::numeric_limits<std::uint64_t>::max()}) ==
        "18446744073709551615");
  CHECK(core::to_hex_string(core::Snowflake{0xABC}) == "0x0000000000000abc");
  CHECK(core::to_hex_string(core::Snowflake{std::numeric_limits<std::uint64_t>::max()}) ==
        "0xffffffffffffffff");
}

TEST_CASE("parse_snowflake accepts decimal and hex", "[codec][text]") {
  SECTION("decimal") {
    const auto parsed = core::parse_snowflake("4194304007");
    REQUIRE(parsed.has_value());
    CHECK(parsed.value().as_u64() == 4'194'304'007ULL);
  }

  SECTION("full 64-bit range") {
    const auto zero = core::parse_snowflake("0");
    REQUIRE(zero.has_value());
    CHECK(zero.value().as_u64() == 0);

    const auto max = core::parse_snowflake("18446744073709551615");
    REQUIRE(max.has_value());
    CHECK(max.value().as_u64() == std::numeric_limits<std::uint64_t>::max());
  }

  SECTION("hex with either prefix case") {
    const auto lower = core::parse_snowflake("0xff");
    REQUIRE(lower.has_value());
    CHECK(lower.value().as_u64() == 255);

    const auto upper = core::parse_snowflake("0XFFFFFFFFFFFFFFFF");
    REQUIRE(upper.has_value());
    CHECK(upper.value().as_u64() == std::numeric_limits<std::uint64_t>::max());
  }

  SECTION("text round-trip") {
    const core::Snowflake id{0x0123'4567'89AB'CDEFULL};
    CHECK(core::parse_snowflake(core::to_string(id)).value() == id);
    CHECK(core::parse_snowflake(core::to_hex_string(id)).value() == id);
  }
}

TEST_CASE("parse_snowflake rejects malformed input", "[codec][text]") {
  const char* const inputs[] = {
      "",     "18446744073709551616", "-1", "+1", " 1", "1 ", "12a", "0x", "0xg1", "abc",
      "1e10", "0x10000000000000000",
  };
  for (const auto* input : inputs) {
    INFO("input: '" << input << "'");
    const auto parsed = core::parse_snowflake(input);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == core::ParseError::kInvalidFormat);
  }
}

TEST_CASE("format_iso8601 renders UTC with milliseconds", "[codec][time]") {
  CHECK(core::format_iso8601(core::from_unix_millis(core::kEpochUnixMillis.count())) ==
        "2019-01-01T00:00:00.000Z");
  CHECK(core::format_iso8601(core::from_unix_millis(1'546'300'801'007)) ==
        "2019-01-01T00:00:01.007Z");
  CHECK(core::format_iso8601(core::from_unix_millis(0)) == "1970-01-01T00:00:00.000Z");

  SECTION("dates outside the generator's range") {
    CHECK(core::format_iso8601(core::from_unix_millis(-1)) == "1969-12-31T23:59:59.999Z");
    CHECK(core::format_iso8601(core::from_unix_millis(4'102'444'800'000)) ==
          "2100-01-01T00:00:00.000Z");
  }
}
