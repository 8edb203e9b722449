#include "cli/registry.hpp"

#include "flyodb/odb.hpp"

#include <iostream>
#include <string>

int cmd_cat_file(int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "usage: flyodb cat-file (-t|-s|-p|-e) <id-or-prefix>\n";
    return 2;
  }
  const std::string mode = argv[1];
  const std::string ref = argv[2];
  if (mode != "-t" && mode != "-s" && mode != "-p" && mode != "-e") {
    std::cerr << "cat-file: unknown mode: " << mode << "\n";
    return 2;
  }

  try {
    auto odb = flyodb::Odb::open(flyodb::cli::objects_dir());
    if (mode == "-p") {
      const auto obj = odb.read_prefix(ref);
      std::cout << obj.str();
      return 0;
    }
    if (mode == "-e") {
      try {
        (void)odb.exists_prefix(ref);
        return 0;
      } catch (const flyodb::OdbError &e) {
        if (e.code() == flyodb::ErrorCode::NotFound) {
          return 1;
        }
        throw;
      }
    }
    const auto hdr = odb.read_header(odb.exists_prefix(ref));
    if (mode == "-t") {
      std::cout << hdr.type << "\n";
    } else {
      std::cout << hdr.size << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "cat-file: " << e.what() << "\n";
    return 1;
  }
}
