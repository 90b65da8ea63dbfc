#include "sfid/core/snowflake.h"

#include <charconv>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace sfid::core {

std::string to_string(const Snowflake id) { return std::to_string(id.as_u64()); }

std::string to_hex_string(const Snowflake id) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << id.as_u64();
  return oss.str();
}

Result<Snowflake, ParseError> parse_snowflake(std::string_view text) {
  int base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
    base = 16;
  }
  if (text.empty()) {
    return Result<Snowflake, ParseError>::err(ParseError::kInvalidFormat);
  }

  // from_chars tolerates neither sign nor whitespace, and reports out-of-range values.
  std::uint64_t value = 0;
  const char* const first = text.data();
  const char* const last = first + text.size();  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto [ptr, ec] = std::from_chars(first, last, value, base);
  if (ec != std::errc{} || ptr != last) {
    return Result<Snowflake, ParseError>::err(ParseError::kInvalidFormat);
  }

  return Result<Snowflake, ParseError>::ok(Snowflake::from_u64(value));
}

}  // namespace sfid::core
