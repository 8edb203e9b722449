#pragma once
#include "flyodb/hash.hpp"

#include <filesystem>

namespace flyodb {

struct OdbOptions {
  HashAlgorithm algorithm = HashAlgorithm::Sha1;
  int compression_level = 1; // zlib level, Z_BEST_SPEED
  bool verify_reads = true;  // re-hash loose objects on read
};

// Read "key: value" options (hash, compression, verify); defaults if missing.
OdbOptions load_options(const std::filesystem::path& file);

// Overwrite the options file with every key.
void save_options(const std::filesystem::path& file, const OdbOptions& options);

} // namespace flyodb
