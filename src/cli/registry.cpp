#include "cli/registry.hpp"

#include "rebranch/consts.hpp"

#include <map>
#include <ostream>

namespace rebranch::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage(std::ostream &os) {
  os << consts::kToolName << " - interactive branch rebasing\n\n";
  os << "usage:\n";
  os << "  " << consts::kToolName << " <base-branch>   Start rebranching the current branch onto base-branch\n";
  os << "  " << consts::kToolName << " -- <base-branch>   Same, for a base branch named like a command\n";
  os << "  " << consts::kToolName << " <option>\n";
  os << "  " << consts::kToolName << " <command> [args]\n\n";

  // Options sort before plain command names
  os << "options and commands:\n";
  for (const auto &[name, e] : table()) {
    os << "  " << name << std::string(name.size() < 12 ? 12 - name.size() : 1, ' ') << e.help
       << "\n";
  }

  os << "\nA base branch called init, add, commit, status, checkout, branch or log\n"
     << "runs that command instead; put -- before it, e.g. `" << consts::kToolName
     << " -- log`.\n";

  os << "\nselection file:\n";
  os << "  pick abc1234 First commit    apply this commit (also: p)\n";
  os << "  drop def5678 Second commit   skip this commit (also: d)\n";
  os << "  Reorder lines to reorder commits; removed lines are dropped.\n";

  os << "\nenvironment:\n";
  os << "  " << consts::kEditorEnv << "  editor for the commit selection (falls back to the 'editor:'\n"
     << "          key of " << consts::kRepoDir << "/" << consts::kConfigFile << ", then "
     << consts::kDefaultEditor << ")\n";
}

} // namespace rebranch::cli
