// Small string helpers shared by the option and alternates parsers
#include "flyodb/util.hpp"

#include <algorithm>
#include <cctype>

namespace flyodb {

bool looks_hex(std::string_view str) {
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

namespace strutil {

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace strutil

} // namespace flyodb
