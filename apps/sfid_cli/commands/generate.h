#pragma once

#include <string>

// cmd_generate: print freshly generated snowflakes, one per line.
// Usage: sfid_cli generate [--count N] [--format decimal|hex|json]
//                          [--fixed-time <unix-ms>] [--seed <n>]
// --fixed-time and --seed make the output reproducible.
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// Option help lines for the usage banner.
std::string generate_options_help();
