#include "cli/registry.hpp"

#include "flyodb/odb.hpp"

#include <iostream>
#include <string>
#include <vector>

int cmd_rev_parse(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: flyodb rev-parse <prefix>...\n";
    return 2;
  }

  try {
    auto odb = flyodb::Odb::open(flyodb::cli::objects_dir());

    std::vector<flyodb::Odb::ExpandId> ids;
    std::vector<std::string> inputs;
    for (int i = 1; i < argc; ++i) {
      flyodb::Oid short_id;
      const std::string hex = argv[i];
      if (!flyodb::from_hex_prefix(hex, short_id, odb.algorithm())) {
        std::cerr << "rev-parse: not a hex id: " << hex << "\n";
        return 1;
      }
      ids.push_back({.id = short_id, .hex_len = hex.size()});
      inputs.push_back(hex);
    }

    odb.expand_ids(ids);

    int rc = 0;
    for (std::size_t i = 0; i < ids.size(); ++i) {
      if (ids[i].result == flyodb::ErrorCode::Ok) {
        std::cout << ids[i].id << "\n";
      } else {
        std::cerr << "rev-parse: " << inputs[i] << ": "
                  << flyodb::error_code_name(ids[i].result) << "\n";
        rc = 1;
      }
    }
    return rc;
  } catch (const std::exception &e) {
    std::cerr << "rev-parse: " << e.what() << "\n";
    return 1;
  }
}
