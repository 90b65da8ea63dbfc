#pragma once

#include "sfid/core/id_generator.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace sfid::cli {

enum class OutputFormat {
  kDecimal,  // NOLINT(readability-identifier-naming)
  kHex,      // NOLINT(readability-identifier-naming)
  kJson,     // NOLINT(readability-identifier-naming)
};

// Upper bound on --count; keeps a mistyped count from flooding the terminal.
inline constexpr std::uint64_t kMaxGenerateCount = 1'000'000;

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view value);

// parse_count accepts a decimal integer in [1, kMaxGenerateCount].
[[nodiscard]] std::optional<std::uint64_t> parse_count(std::string_view value);

// parse_fixed_time accepts Unix milliseconds representable by the system clock.
[[nodiscard]] std::optional<std::int64_t> parse_fixed_time(std::string_view value);

// parse_unsigned / parse_signed accept a full decimal integer, nothing else.
[[nodiscard]] std::optional<std::uint64_t> parse_unsigned(std::string_view value);
[[nodiscard]] std::optional<std::int64_t> parse_signed(std::string_view value);

// execute_generate writes count identifiers to out, one per line, in the
// requested format. Stops at the first generation failure, reports it to err
// and returns 1. Takes only interface types so tests can inject fixed inputs.
int execute_generate(core::ISnowflakeGenerator& generator, std::uint64_t count,
                     OutputFormat format, std::ostream& out, std::ostream& err);

}  // namespace sfid::cli
