#include "sfid/core/version.h"

#include "commands/decode.h"
#include "commands/generate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: sfid_cli <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  generate    Print freshly generated snowflakes\n"
            << "  decode      Print the bit fields of existing snowflakes\n"
            << "\n"
            << "generate options:\n"
            << generate_options_help() << "\n"
            << "decode options:\n"
            << decode_options_help() << "\n"
            << "  --version   Print the version and exit\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << "sfid_cli v" << sfid::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
