#pragma once

#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace sfid::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. Handlers
// report their own diagnostics to stderr.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedArgs is the outcome of parse_options.
// args_valid is false if any flag was unknown, lacked its value, or was
// rejected by its handler. Every flag is still processed so that all
// problems are reported in one run.
template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  bool args_valid{true};                 // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler and collects non-flag tokens as positionals, in order.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (arg.size() > 1 && arg[0] == '-') {
        std::cerr << "Unknown option: " << arg << "\n";
        parsed.args_valid = false;
      } else {
        parsed.positionals.push_back(std::move(arg));
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      parsed.args_valid = opt->handler(parsed.config, "") && parsed.args_valid;
    } else if (i + 1 < argc) {
      const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      parsed.args_valid = opt->handler(parsed.config, value) && parsed.args_valid;
    } else {
      std::cerr << "Option " << arg << " requires a value\n";
      parsed.args_valid = false;
    }
  }

  return parsed;
}

// format_options renders one "  --flag <value>  description" line per option.
template <typename Config>
std::string format_options(const std::vector<Option<Config>>& options) {
  std::ostringstream oss;
  for (const auto& opt : options) {
    std::string flag = opt.name;
    if (opt.requires_value) {
      flag += " <value>";
    }
    oss << "  " << flag;
    if (flag.size() < 24) {
      oss << std::string(24 - flag.size(), ' ');
    } else {
      oss << "  ";
    }
    oss << opt.description << "\n";
  }
  return oss.str();
}

}  // namespace sfid::apps
