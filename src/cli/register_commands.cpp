#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_hash_object(int argc, char **argv);
int cmd_cat_file(int argc, char **argv);
int cmd_ls_objects(int, char **);
int cmd_rev_parse(int argc, char **argv);
int cmd_alternates(int argc, char **argv);

namespace flyodb::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Create an empty objects directory: flyodb init [--sha256] [dir]");
  register_command("hash-object", ::cmd_hash_object,
                   "Compute (and with -w store) an object id: flyodb hash-object [-t <type>] [-w] <file>");
  register_command("cat-file", ::cmd_cat_file,
                   "Show object type/size/content: flyodb cat-file (-t|-s|-p|-e) <id-or-prefix>");
  register_command("ls-objects", ::cmd_ls_objects, "List every object id in the store");
  register_command("rev-parse", ::cmd_rev_parse, "Expand abbreviated ids: flyodb rev-parse <prefix>...");
  register_command("alternates", ::cmd_alternates,
                   "Show or extend the alternates chain: flyodb alternates [add <objects-dir>]");
}

} // namespace flyodb::cli
