#pragma once
#include <string>
#include <string_view>

namespace flyodb {

// True when every character of str is a hex digit (either case).
auto looks_hex(std::string_view str) -> bool;

// String helpers
namespace strutil {
  // Strip leading spaces/tabs and trailing spaces/tabs/CR
  auto trim(std::string_view sv) -> std::string;
}

} // namespace flyodb
