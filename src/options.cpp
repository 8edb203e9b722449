#include "flyodb/options.hpp"

#include "flyodb/error.hpp"
#include "flyodb/fs.hpp"
#include "flyodb/util.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

namespace {

[[noreturn]] void bad_value(const std::filesystem::path &file, std::string_view key,
                            std::string_view value) {
  flyodb::fail(flyodb::ErrorCode::InvalidArgument, "options " + file.string(),
               "bad value for '" + std::string(key) + "': '" + std::string(value) + "'");
}

} // namespace

namespace flyodb {

auto load_options(const std::filesystem::path &file) -> OdbOptions {
  OdbOptions out{};
  if (!fs::exists(file))
    return out;

  const auto bytes = fs::read_file(file);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    const std::string key = strutil::trim(sv.substr(0, colon));
    const std::string value = strutil::trim(sv.substr(colon + 1));

    if (key == "hash") {
      if (value == algorithm_name(HashAlgorithm::Sha1)) {
        out.algorithm = HashAlgorithm::Sha1;
      } else if (value == algorithm_name(HashAlgorithm::Sha256)) {
        out.algorithm = HashAlgorithm::Sha256;
      } else {
        bad_value(file, key, value);
      }
    } else if (key == "compression") {
      int level = -1;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), level);
      if (ec != std::errc{} || ptr != value.data() + value.size() || level < 0 || level > 9)
        bad_value(file, key, value);
      out.compression_level = level;
    } else if (key == "verify") {
      if (value == "true") {
        out.verify_reads = true;
      } else if (value == "false") {
        out.verify_reads = false;
      } else {
        bad_value(file, key, value);
      }
    }
  }
  return out;
}

void save_options(const std::filesystem::path &file, const OdbOptions &options) {
  std::ostringstream os;
  os << "hash: " << algorithm_name(options.algorithm) << '\n'
     << "compression: " << options.compression_level << '\n'
     << "verify: " << (options.verify_reads ? "true" : "false") << '\n';
  fs::write_file_atomic(file, os.str());
}

} // namespace flyodb
