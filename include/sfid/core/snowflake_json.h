#pragma once

#include "sfid/core/snowflake.h"

#include <nlohmann/json.hpp>

namespace sfid::core {

/// Serialize as a decimal string. JSON numbers lose precision above 2^53 in
/// most consumers, so the raw value is never emitted as a number.
[[nodiscard]] nlohmann::json snowflake_to_json(Snowflake id);

/// Accepts an unsigned number or a string understood by parse_snowflake.
/// Throws nlohmann::json::type_error for other JSON types and
/// std::invalid_argument for unparsable strings.
[[nodiscard]] Snowflake snowflake_from_json(const nlohmann::json& j);

/// Decoded view of every bit field, for diagnostics and tooling.
[[nodiscard]] nlohmann::json describe_json(Snowflake id);

}  // namespace sfid::core

// Snowflake has no default constructor, so conversion goes through a
// serializer specialization instead of ADL to_json/from_json hooks.
namespace nlohmann {

template <>
struct adl_serializer<sfid::core::Snowflake> {
  static sfid::core::Snowflake from_json(const json& j) {
    return sfid::core::snowflake_from_json(j);
  }
  static void to_json(json& j, const sfid::core::Snowflake& id) {
    j = sfid::core::snowflake_to_json(id);
  }
};

}  // namespace nlohmann
