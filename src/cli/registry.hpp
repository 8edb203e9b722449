#pragma once
#include <filesystem>
#include <string>
#include "cli/command.hpp"

namespace flyodb::cli {

void register_command(const std::string& name, command_fn fn, const std::string& help);
command_fn find_command(const std::string& name);
void print_usage();

// implemented in register_commands.cpp
void register_all_commands();

// Objects directory the commands operate on (--odb, default ./objects).
void set_objects_dir(std::filesystem::path dir);
const std::filesystem::path& objects_dir();

} // namespace flyodb::cli
