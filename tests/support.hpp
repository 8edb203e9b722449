#pragma once
#include "flyodb/error.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <random>
#include <span>
#include <string>
#include <string_view>

namespace testsupport {

inline std::span<const std::uint8_t> bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

// Fresh directory under the system temp dir; caller removes it.
inline std::filesystem::path temp_root(std::string_view name) {
  const auto root = std::filesystem::temp_directory_path() /
                    (std::string("flyodb_") + std::string(name) + "_" +
                     std::to_string(std::random_device{}()));
  std::filesystem::create_directories(root);
  return root;
}

// Run fn; true iff it threw an OdbError with the expected code.
template <class Fn> bool throws_code(flyodb::ErrorCode expected, Fn &&fn) {
  try {
    fn();
  } catch (const flyodb::OdbError &e) {
    if (e.code() != expected) {
      std::cerr << "  wrong error code: " << flyodb::error_code_name(e.code()) << " ("
                << e.what() << ")\n";
      return false;
    }
    return true;
  }
  return false;
}

} // namespace testsupport
