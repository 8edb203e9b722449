#include "cli/registry.hpp"

#include "flyodb/consts.hpp"
#include "flyodb/fs.hpp"
#include "flyodb/options.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace stdfs = std::filesystem;

int cmd_init(int argc, char **argv) {
  flyodb::OdbOptions options{};
  stdfs::path dir = flyodb::cli::objects_dir();
  bool have_dir = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--sha256") {
      options.algorithm = flyodb::HashAlgorithm::Sha256;
    } else if (!have_dir && !arg.starts_with("-")) {
      dir = arg;
      have_dir = true;
    } else {
      std::cerr << "usage: flyodb init [--sha256] [dir]\n";
      return 2;
    }
  }

  const stdfs::path config = dir / flyodb::consts::kInfoDir / flyodb::consts::kConfigFile;
  try {
    if (flyodb::fs::exists(config)) {
      std::cerr << "init: already initialized: " << dir << "\n";
      return 1;
    }
    stdfs::create_directories(dir / flyodb::consts::kInfoDir);
    flyodb::save_options(config, options);
    std::cout << "Initialized empty object store in " << dir << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
