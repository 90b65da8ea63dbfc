#include "decode.h"

#include "decode_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

std::vector<sfid::apps::Option<sfid::cli::DecodeOptions>> build_decode_options() {
  return {
      {"--require-generated-layout", false, "Fail on identifiers with bit 63 or bit 21 set",
       [](sfid::cli::DecodeOptions& c, const std::string& /* value */) {
         c.require_generated_layout = true;
         return true;
       }},
  };
}

}  // namespace

std::string decode_options_help() { return sfid::apps::format_options(build_decode_options()); }

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_decode_options();
  const auto parsed = sfid::apps::parse_options(argc, argv, options, 2);

  if (!parsed.args_valid) {
    return 1;
  }
  if (parsed.positionals.empty()) {
    std::cerr << "Usage: sfid_cli decode [--require-generated-layout] <id> [<id> ...]\n";
    return 1;
  }

  return sfid::cli::execute_decode(parsed.positionals, parsed.config, std::cout, std::cerr);
}
