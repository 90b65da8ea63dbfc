#pragma once

#include <string>

// cmd_decode: print the bit fields of existing snowflakes as JSON lines.
// Usage: sfid_cli decode [--require-generated-layout] <id> [<id> ...]
// Identifiers may be decimal or 0x-prefixed hexadecimal.
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// Option help lines for the usage banner.
std::string decode_options_help();
