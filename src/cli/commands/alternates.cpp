#include "cli/registry.hpp"

#include "flyodb/consts.hpp"
#include "flyodb/fs.hpp"
#include "flyodb/odb.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace stdfs = std::filesystem;

// Append a line to info/alternates after checking the target opens.
// Stored absolute: relative entries resolve against the objects directory.
static int add_alternate(const stdfs::path &dir, const stdfs::path &arg) {
  const stdfs::path alt = stdfs::absolute(arg);
  auto odb = flyodb::Odb::open(dir);
  odb.add_disk_alternate(alt); // validates the path

  const stdfs::path file = dir / flyodb::consts::kInfoDir / flyodb::consts::kAlternatesFile;
  std::string text;
  if (flyodb::fs::exists(file)) {
    const auto bytes = flyodb::fs::read_file(file);
    text.assign(bytes.begin(), bytes.end());
    if (!text.empty() && text.back() != flyodb::consts::kLF) {
      text.push_back(flyodb::consts::kLF);
    }
  }
  text += alt.string();
  text.push_back(flyodb::consts::kLF);
  flyodb::fs::write_file_atomic(file, text);
  std::cout << "added alternate: " << alt << "\n";
  return 0;
}

int cmd_alternates(int argc, char **argv) {
  try {
    const stdfs::path dir = flyodb::cli::objects_dir();
    if (argc == 3 && std::string(argv[1]) == "add") {
      return add_alternate(dir, argv[2]);
    }
    if (argc != 1) {
      std::cerr << "usage: flyodb alternates [add <objects-dir>]\n";
      return 2;
    }
    const auto odb = flyodb::Odb::open(dir);
    for (std::size_t i = 0; i < odb.num_backends(); ++i) {
      std::cout << (odb.is_alternate(i) ? "alternate " : "primary   ")
                << odb.backend(i).describe() << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "alternates: " << e.what() << "\n";
    return 1;
  }
}
