#include "cli/registry.hpp"

#include "flyodb/odb.hpp"

#include <iostream>

int cmd_ls_objects(int /*argc*/, char ** /*argv*/) {
  try {
    auto odb = flyodb::Odb::open(flyodb::cli::objects_dir());
    for (const auto &id : odb.objects()) {
      std::cout << id << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "ls-objects: " << e.what() << "\n";
    return 1;
  }
}
