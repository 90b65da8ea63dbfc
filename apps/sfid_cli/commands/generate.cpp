#include "generate.h"

#include "sfid/core/clock.h"
#include "sfid/core/id_generator.h"
#include "sfid/core/random_source.h"
#include "sfid/core/time.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  std::uint64_t count{1};
  sfid::cli::OutputFormat format{sfid::cli::OutputFormat::kDecimal};
  std::optional<std::int64_t> fixed_time_ms;
  std::optional<std::uint64_t> seed;
};

std::vector<sfid::apps::Option<GenerateCliConfig>> build_generate_options() {
  return {
      {"--count", true, "Number of identifiers to generate (default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         auto count = sfid::cli::parse_count(v);
         if (!count.has_value()) {
           std::cerr << "Invalid --count: " << v << " (valid: 1.."
                     << sfid::cli::kMaxGenerateCount << ")\n";
           return false;
         }
         c.count = count.value();
         return true;
       }},
      {"--format", true, "Output format (decimal|hex|json)",
       [](GenerateCliConfig& c, const std::string& v) {
         auto format = sfid::cli::parse_output_format(v);
         if (!format.has_value()) {
           std::cerr << "Invalid --format: " << v << " (valid: decimal, hex, json)\n";
           return false;
         }
         c.format = format.value();
         return true;
       }},
      {"--fixed-time", true, "Use a fixed clock reading, in Unix milliseconds",
       [](GenerateCliConfig& c, const std::string& v) {
         auto millis = sfid::cli::parse_fixed_time(v);
         if (!millis.has_value()) {
           std::cerr << "Invalid --fixed-time: " << v << " (expected Unix milliseconds)\n";
           return false;
         }
         c.fixed_time_ms = millis.value();
         return true;
       }},
      {"--seed", true, "Seed a deterministic random source",
       [](GenerateCliConfig& c, const std::string& v) {
         auto seed = sfid::cli::parse_unsigned(v);
         if (!seed.has_value()) {
           std::cerr << "Invalid --seed: " << v << " (expected unsigned integer)\n";
           return false;
         }
         c.seed = seed.value();
         return true;
       }},
  };
}

}  // namespace

std::string generate_options_help() { return sfid::apps::format_options(build_generate_options()); }

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_generate_options();
  auto parsed = sfid::apps::parse_options(argc, argv, options, 2);

  if (!parsed.positionals.empty()) {
    std::cerr << "Unexpected argument: " << parsed.positionals.front() << "\n";
    return 1;
  }
  if (!parsed.args_valid) {
    return 1;
  }
  const auto& config = parsed.config;

  std::unique_ptr<sfid::core::IClock> clock;
  if (config.fixed_time_ms.has_value()) {
    clock = std::make_unique<sfid::core::FixedClock>(
        sfid::core::from_unix_millis(config.fixed_time_ms.value()));
  } else {
    clock = std::make_unique<sfid::core::SystemClock>();
  }

  std::unique_ptr<sfid::core::IRandomSource> random;
  if (config.seed.has_value()) {
    random = std::make_unique<sfid::core::DeterministicRandomSource>(config.seed.value());
  } else {
    random = std::make_unique<sfid::core::ThreadLocalRandomSource>();
  }

  sfid::core::SnowflakeGenerator generator(*clock, *random);
  return sfid::cli::execute_generate(generator, config.count, config.format, std::cout,
                                     std::cerr);
}
