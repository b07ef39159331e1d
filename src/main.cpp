#include "cli/registry.hpp"

#include "commitgate/consts.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  commitgate::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    commitgate::cli::print_usage();
    return commitgate::consts::kExitUsage;
  }
  const std::string cmd = argv[1];

  const auto fn = commitgate::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    commitgate::cli::print_usage();
    return commitgate::consts::kExitUsage;
  }
  // Pass everything after the subcommand to the handler
  return fn(argc - 1, argv + 1);
}
