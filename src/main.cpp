#include "cli/registry.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  flyodb::cli::register_all_commands(); // defined in register_commands.cpp

  int first = 1;
  if (argc >= 3 && std::string(argv[1]) == "--odb") {
    flyodb::cli::set_objects_dir(argv[2]);
    first = 3;
  }
  if (argc <= first) {
    flyodb::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[first];

  const auto fn = flyodb::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    flyodb::cli::print_usage();
    return 2;
  }
  // Pass everything after the global options to the handler
  return fn(argc - first, argv + first);
}
