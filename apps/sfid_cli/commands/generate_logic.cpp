#include "generate_logic.h"

#include "sfid/core/snowflake.h"
#include "sfid/core/snowflake_json.h"
#include "sfid/core/time.h"

#include <charconv>
#include <chrono>
#include <system_error>

namespace sfid::cli {

namespace {

template <typename Int>
std::optional<Int> parse_integer(const std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  Int parsed{};
  const char* const last = value.data() + value.size();  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto [ptr, ec] = std::from_chars(value.data(), last, parsed);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

std::optional<OutputFormat> parse_output_format(const std::string_view value) {
  if (value == "decimal") {
    return OutputFormat::kDecimal;
  }
  if (value == "hex") {
    return OutputFormat::kHex;
  }
  if (value == "json") {
    return OutputFormat::kJson;
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_count(const std::string_view value) {
  const auto count = parse_unsigned(value);
  if (!count.has_value() || count.value() == 0 || count.value() > kMaxGenerateCount) {
    return std::nullopt;
  }
  return count;
}

std::optional<std::int64_t> parse_fixed_time(const std::string_view value) {
  const auto millis = parse_signed(value);
  if (!millis.has_value()) {
    return std::nullopt;
  }
  constexpr auto kLimit =
      std::chrono::duration_cast<std::chrono::milliseconds>(core::Clock::duration::max()).count();
  if (millis.value() > kLimit || millis.value() < -kLimit) {
    return std::nullopt;
  }
  return millis;
}

std::optional<std::uint64_t> parse_unsigned(const std::string_view value) {
  return parse_integer<std::uint64_t>(value);
}

std::optional<std::int64_t> parse_signed(const std::string_view value) {
  return parse_integer<std::int64_t>(value);
}

int execute_generate(core::ISnowflakeGenerator& generator, const std::uint64_t count,
                     const OutputFormat format, std::ostream& out, std::ostream& err) {
  for (std::uint64_t i = 0; i < count; ++i) {
    const auto result = generator.next();
    if (!result.has_value()) {
      err << "Error: snowflake generation failed: " << core::to_string(result.error()) << "\n";
      return 1;
    }

    const auto id = result.value();
    switch (format) {
      case OutputFormat::kDecimal:
        out << core::to_string(id) << "\n";
        break;
      case OutputFormat::kHex:
        out << core::to_hex_string(id) << "\n";
        break;
      case OutputFormat::kJson:
        out << core::describe_json(id).dump() << "\n";
        break;
    }
  }
  return 0;
}

}  // namespace sfid::cli
