#include "cli/registry.hpp"

#include <iostream>
#include <string>

int cmd_start(int argc, char **argv);

int main(int argc, char **argv) {
  rebranch::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    rebranch::cli::print_usage(std::cerr);
    return 2;
  }
  const std::string cmd = argv[1];

  // "rebranch -- <base>" names a base branch that collides with a command
  if (cmd == "--") {
    return cmd_start(argc - 1, argv + 1);
  }

  if (const auto fn = rebranch::cli::find_command(cmd)) {
    // Pass everything after the subcommand to the handler
    return fn(argc - 1, argv + 1);
  }
  if (cmd.starts_with("-")) {
    std::cerr << "unknown option: " << cmd << "\n";
    rebranch::cli::print_usage(std::cerr);
    return 2;
  }
  // Anything else is the base branch; argv[1] stays in place for the handler
  return cmd_start(argc, argv);
}
