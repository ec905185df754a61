#include "cli/session.hpp"

#include "rebranch/repo.hpp"
#include "rebranch/util.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

int list_branches(const rebranch::Repository &repo) {
  const auto current = repo.current_branch();
  if (!std::filesystem::exists(repo.heads_dir())) {
    return 0;
  }
  for (const auto &e : std::filesystem::recursive_directory_iterator(repo.heads_dir())) {
    if (!e.is_regular_file()) {
      continue;
    }
    const std::string name = e.path().lexically_relative(repo.heads_dir()).generic_string();
    std::cout << (current == name ? "* " : "  ") << name << "\n";
  }
  return 0;
}

} // namespace

int cmd_branch(int argc, char **argv) {
  const auto repo = rebranch::cli::open_repository("branch");
  if (!repo) {
    return 1;
  }

  try {
    if (argc < 2) {
      return list_branches(*repo);
    }

    const std::string name = argv[1];
    const auto head = repo->head_commit();
    if (!head) {
      std::cerr << "branch: current branch has no commits\n";
      return 1;
    }
    repo->create_branch(name, *head);
    std::cout << "Branch '" << name << "' created at " << rebranch::short_id(*head) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "branch: " << e.what() << "\n";
    return 1;
  }
}
