#include "cli/registry.hpp"

// rebranch workflow
int cmd_continue(int argc, char **argv);
int cmd_done(int argc, char **argv);
int cmd_abort(int argc, char **argv);
int cmd_help(int argc, char **argv);
int cmd_version(int argc, char **argv);

// repository plumbing
int cmd_init(int argc, char **argv);
int cmd_add(int argc, char **argv);
int cmd_commit(int argc, char **argv);
int cmd_status(int, char **);
int cmd_checkout(int, char **);
int cmd_branch(int, char **);
int cmd_log(int, char **);

namespace rebranch::cli {

void register_all_commands() {
  register_command("--continue", ::cmd_continue, "Continue after resolving conflicts");
  register_command("--done", ::cmd_done, "Replace the original branch with the rebranched one");
  register_command("--abort", ::cmd_abort, "Cancel the rebranch and restore the original branch");
  register_command("--help", ::cmd_help, "Show this help message");
  register_command("-h", ::cmd_help, "Show this help message");
  register_command("--version", ::cmd_version, "Show version information");
  register_command("-v", ::cmd_version, "Show version information");

  register_command("init", ::cmd_init, "Initialize a new repository");
  register_command("add", ::cmd_add, "Add file(s) to the index: rebranch add <path>...");
  register_command("commit", ::cmd_commit, "Commit staged changes: rebranch commit -m <message>");
  register_command("status", ::cmd_status, "Show staged/unstaged/untracked changes");
  register_command("checkout", ::cmd_checkout, "Switch to branch: rebranch checkout <name>");
  register_command("branch", ::cmd_branch, "List branches, or create one: rebranch branch <name>");
  register_command("log", ::cmd_log, "Show commit log from HEAD");
}

} // namespace rebranch::cli
