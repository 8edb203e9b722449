#include "cli/registry.hpp"

#include "flyodb/consts.hpp"

#include <iostream>
#include <map>
#include <utility>

namespace flyodb::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

static std::filesystem::path &objects_dir_slot() {
  static std::filesystem::path dir = std::filesystem::current_path() / consts::kObjectsDir;
  return dir;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::cerr << "usage: flyodb [--odb <objects-dir>] <command> [args]\n\n";
  std::cerr << "commands:\n";
  for (auto &[name, e] : table()) {
    std::cerr << "  " << name << "  " << e.help << "\n";
  }
}

void set_objects_dir(std::filesystem::path dir) { objects_dir_slot() = std::move(dir); }

const std::filesystem::path &objects_dir() { return objects_dir_slot(); }

} // namespace flyodb::cli
