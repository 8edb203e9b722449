#pragma once

namespace flyodb::cli {

// Subcommand entry point: argv[0] is the subcommand name.
using command_fn = int (*)(int argc, char **argv);

} // namespace flyodb::cli
