#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_add(int argc, char **argv);
int cmd_commit(int argc, char **argv);
int cmd_diff(int, char **);
int cmd_suggest(int, char **);

namespace prism::cli {

void register_all_commands() {
  register_command("diff", ::cmd_diff, command_group::review,
                   "[--context N] [--rename-threshold P] [--copy-threshold P]",
                   "Show HEAD against its first parent");
  register_command("suggest", ::cmd_suggest, command_group::review,
                   "[--dry-run] [-t title] -e <path> <line[:col]> <line[:col]> <text>...",
                   "Preview or apply suggested edits and stage them");
  register_command("init", ::cmd_init, command_group::repository, "",
                   "Initialize a new repository");
  register_command("add", ::cmd_add, command_group::repository, "<path>...", "Stage files");
  register_command("commit", ::cmd_commit, command_group::repository, "-m <message>",
                   "Commit staged changes");
}

} // namespace prism::cli
