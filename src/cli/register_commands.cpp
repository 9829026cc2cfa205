#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_track(int argc, char **argv);
int cmd_track_downstack(int argc, char **argv);
int cmd_untrack(int argc, char **argv);
int cmd_restack(int argc, char **argv);
int cmd_restack_upstack(int argc, char **argv);
int cmd_onto(int argc, char **argv);
int cmd_rename(int argc, char **argv);
int cmd_reorder(int argc, char **argv);
int cmd_ls(int argc, char **argv);
int cmd_rebase_continue(int argc, char **argv);
int cmd_rebase_abort(int argc, char **argv);
int cmd_state_log(int argc, char **argv);

namespace gitstack::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Initialize the branch store: gitstack init <trunk> [remote] [--reset]");
  register_command("track", ::cmd_track, "Track a branch: gitstack track [--base <base>] <branch>");
  register_command("track-downstack", ::cmd_track_downstack,
                   "Track a branch and its untracked downstack: gitstack track-downstack <branch>");
  register_command("untrack", ::cmd_untrack, "Stop tracking a branch: gitstack untrack <branch>");
  register_command("restack", ::cmd_restack,
                   "Rebase a branch onto its base: gitstack restack <branch>");
  register_command("restack-upstack", ::cmd_restack_upstack,
                   "Restack a branch and everything above it: gitstack restack-upstack <branch>");
  register_command("onto", ::cmd_onto, "Move a branch onto another base: gitstack onto <branch> <base>");
  register_command("rename", ::cmd_rename, "Rename a tracked branch: gitstack rename <old> <new>");
  register_command("reorder", ::cmd_reorder,
                   "Reorder the stack containing the listed branches: gitstack reorder <bottom>... <top>");
  register_command("ls", ::cmd_ls, "Show tracked branches: gitstack ls [branch]");
  register_command("rebase-continue", ::cmd_rebase_continue,
                   "Continue an interrupted rebase and resume pending commands");
  register_command("rebase-abort", ::cmd_rebase_abort,
                   "Abort an interrupted rebase and drop pending commands");
  register_command("state-log", ::cmd_state_log, "Show the history of the branch store");
}

} // namespace gitstack::cli
