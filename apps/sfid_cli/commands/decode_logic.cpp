#include "decode_logic.h"

#include "sfid/core/snowflake.h"
#include "sfid/core/snowflake_json.h"

namespace sfid::cli {

int execute_decode(const std::vector<std::string>& inputs, const DecodeOptions& options,
                   std::ostream& out, std::ostream& err) {
  int exit_code = 0;

  for (const auto& input : inputs) {
    const auto parsed = core::parse_snowflake(input);
    if (!parsed.has_value()) {
      err << "Invalid snowflake: " << input << " (" << core::to_string(parsed.error()) << ")\n";
      exit_code = 1;
      continue;
    }

    const auto id = parsed.value();
    if (options.require_generated_layout && !id.has_generated_layout()) {
      err << "Snowflake " << input << " has reserved bits set (sign="
          << (id.sign_bit() ? 1 : 0) << ", separator=" << (id.separator_bit() ? 1 : 0) << ")\n";
      exit_code = 1;
      continue;
    }

    out << core::describe_json(id).dump() << "\n";
  }

  return exit_code;
}

}  // namespace sfid::cli
