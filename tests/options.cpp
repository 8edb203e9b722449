#include "flyodb/consts.hpp"
#include "flyodb/fs.hpp"
#include "flyodb/odb.hpp"
#include "flyodb/options.hpp"

#include "support.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using flyodb::ErrorCode;
using testsupport::throws_code;

int main() {
  const fs::path root = testsupport::temp_root("options");

  try {
    // Missing file -> defaults
    const auto defaults = flyodb::load_options(root / "nope");
    if (defaults.algorithm != flyodb::HashAlgorithm::Sha1 || defaults.compression_level != 1 ||
        !defaults.verify_reads) {
      std::cerr << "unexpected defaults\n";
      return 1;
    }

    // Comments, whitespace, unknown keys
    const fs::path cfg = root / "config";
    flyodb::fs::write_file_atomic(cfg, std::string_view("# store settings\n"
                                                        "hash:   sha256\r\n"
                                                        "compression: 9\n"
                                                        "colour: blue\n"
                                                        "verify: false\n"));
    const auto loaded = flyodb::load_options(cfg);
    if (loaded.algorithm != flyodb::HashAlgorithm::Sha256 || loaded.compression_level != 9 ||
        loaded.verify_reads) {
      std::cerr << "options not parsed\n";
      return 1;
    }

    // save -> load keeps every key
    flyodb::save_options(cfg, flyodb::OdbOptions{.algorithm = flyodb::HashAlgorithm::Sha1,
                                                 .compression_level = 0,
                                                 .verify_reads = true});
    const auto again = flyodb::load_options(cfg);
    if (again.algorithm != flyodb::HashAlgorithm::Sha1 || again.compression_level != 0 ||
        !again.verify_reads) {
      std::cerr << "save/load mismatch\n";
      return 1;
    }

    // Malformed values
    for (const std::string_view text : {"hash: md5\n", "compression: 10\n", "compression: x\n",
                                        "verify: yes\n"}) {
      flyodb::fs::write_file_atomic(cfg, text);
      if (!throws_code(ErrorCode::InvalidArgument, [&cfg] { (void)flyodb::load_options(cfg); })) {
        std::cerr << "accepted bad options: " << text;
        return 1;
      }
    }

    // Odb::open picks up info/config
    const fs::path objects = root / "objects";
    fs::create_directories(objects / flyodb::consts::kInfoDir);
    flyodb::save_options(objects / flyodb::consts::kInfoDir / flyodb::consts::kConfigFile,
                         flyodb::OdbOptions{.algorithm = flyodb::HashAlgorithm::Sha256});
    auto odb = flyodb::Odb::open(objects);
    if (odb.algorithm() != flyodb::HashAlgorithm::Sha256) {
      std::cerr << "open ignored info/config\n";
      return 1;
    }
    const auto id = odb.write(flyodb::ObjectType::Blob, std::string_view("hello\n"));
    if (id.hex() != "2cf8d83d9ee29543b34a87727421fdecb7e3f3a183d337639025de576db9ebb4") {
      std::cerr << "sha256 store wrote " << id << "\n";
      return 1;
    }
    if (odb.read(id).str() != "hello\n" || odb.exists_prefix("2cf8d8") != id) {
      std::cerr << "sha256 store read back failed\n";
      return 1;
    }
    // sha1 ids never match a sha256 store
    if (odb.exists(flyodb::Odb::hash(flyodb::ObjectType::Blob, testsupport::bytes("hello\n")))) {
      std::cerr << "sha1 id found in sha256 store\n";
      return 1;
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
