#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  prism::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    prism::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[1];
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    std::cout << prism::cli::usage_text();
    return 0;
  }

  const auto fn = prism::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "prism: unknown command: " << cmd << "\n";
    prism::cli::print_usage();
    return 2;
  }
  // the handler sees its own name as argv[0]
  return fn(argc - 1, argv + 1);
}
