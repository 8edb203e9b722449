#include "cli/registry.hpp"

#include "flyodb/consts.hpp"
#include "flyodb/fs.hpp"
#include "flyodb/odb.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace stdfs = std::filesystem;

// Stream a file into the store in fixed-size chunks.
static flyodb::Oid write_streamed(flyodb::Odb &odb, const stdfs::path &file,
                                  flyodb::ObjectType type) {
  const auto size = static_cast<std::size_t>(stdfs::file_size(file));
  std::ifstream ifs(file, std::ios::binary);
  if (!ifs) {
    flyodb::fail(flyodb::ErrorCode::Io, "open for read failed", file.string());
  }
  auto ws = odb.open_wstream(size, type);
  std::array<char, 64 * 1024> buf{};
  while (ifs) {
    ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = static_cast<std::size_t>(ifs.gcount());
    if (got == 0) {
      break;
    }
    ws.write(std::string_view(buf.data(), got));
  }
  return ws.finalize();
}

int cmd_hash_object(int argc, char **argv) {
  flyodb::ObjectType type = flyodb::ObjectType::Blob;
  bool write = false;
  stdfs::path file;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-w") {
      write = true;
    } else if (arg == "-t" && i + 1 < argc) {
      type = flyodb::type_from_name(argv[++i]);
      if (type == flyodb::ObjectType::Invalid) {
        std::cerr << "hash-object: unknown type: " << argv[i] << "\n";
        return 2;
      }
    } else if (file.empty()) {
      file = arg;
    } else {
      file.clear();
      break;
    }
  }
  if (file.empty()) {
    std::cerr << "usage: flyodb hash-object [-t <type>] [-w] <file>\n";
    return 2;
  }

  try {
    const stdfs::path dir = flyodb::cli::objects_dir();
    if (write) {
      auto odb = flyodb::Odb::open(dir);
      std::cout << write_streamed(odb, file, type) << "\n";
      return 0;
    }
    const auto options =
        flyodb::load_options(dir / flyodb::consts::kInfoDir / flyodb::consts::kConfigFile);
    const auto bytes = flyodb::fs::read_file(file);
    std::cout << flyodb::Odb::hash(type, bytes, options.algorithm) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "hash-object: " << e.what() << "\n";
    return 1;
  }
}
