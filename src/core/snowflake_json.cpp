#include "sfid/core/snowflake_json.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace sfid::core {

nlohmann::json snowflake_to_json(const Snowflake id) { return to_string(id); }

Snowflake snowflake_from_json(const nlohmann::json& j) {
  if (j.is_number_unsigned()) {
    return Snowflake::from_u64(j.get<std::uint64_t>());
  }
  if (j.is_number_integer()) {
    // Signed storage only happens for values built from signed C++ integers.
    const auto signed_value = j.get<std::int64_t>();
    if (signed_value < 0) {
      throw std::invalid_argument("Invalid snowflake: negative value " +
                                  std::to_string(signed_value));
    }
    return Snowflake::from_u64(static_cast<std::uint64_t>(signed_value));
  }

  // Throws type_error when j is neither a string nor an unsigned number.
  const auto text = j.get<std::string>();
  const auto parsed = parse_snowflake(text);
  if (!parsed.has_value()) {
    throw std::invalid_argument("Invalid snowflake: '" + text + "'");
  }
  return parsed.value();
}

nlohmann::json describe_json(const Snowflake id) {
  nlohmann::json j;
  j["id"] = to_string(id);
  j["hex"] = to_hex_string(id);
  j["timestamp_ms"] = id.timestamp_millis();
  j["unix_ms"] = id.unix_millis();
  j["created_at"] = format_iso8601(id.created_at());
  j["random"] = id.random_part();
  j["separator_bit"] = id.separator_bit() ? 1 : 0;
  j["sign_bit"] = id.sign_bit() ? 1 : 0;
  j["generated_layout"] = id.has_generated_layout();
  return j;
}

}  // namespace sfid::core
