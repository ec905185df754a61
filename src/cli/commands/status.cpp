#include "rebranch/status.hpp"

#include "cli/session.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/repo.hpp"
#include "rebranch/util.hpp"

#include <iostream>

using rebranch::ChangeKind;

int cmd_status(int /*argc*/, char ** /*argv*/) {
  const auto repo = rebranch::cli::open_repository("status");
  if (!repo) {
    return 1;
  }

  try {
    if (const auto branch = repo->current_branch()) {
      std::cout << "On branch " << *branch << "\n";
    } else if (const auto head = repo->head_commit()) {
      std::cout << "HEAD detached at " << rebranch::short_id(*head) << "\n";
    }
    if (repo->has_marker(rebranch::consts::kStateFile)) {
      std::cout << "Rebranch in progress (rebranch --continue, --done or --abort)\n";
    }
    if (repo->has_marker(rebranch::consts::kCherryPickHead)) {
      std::cout << "Cherry-pick stopped on conflicts; add the resolved files and commit\n";
    }
    std::cout << "\n";

    const auto st = rebranch::compute_status(*repo);

    auto print_changes = [](const char *header, const std::vector<rebranch::Change> &xs) {
      std::cout << header << "\n";
      for (const auto &[kind, path] : xs) {
        const char code = (kind == ChangeKind::Added      ? 'A'
                           : kind == ChangeKind::Modified ? 'M'
                                                          : 'D');
        std::cout << "  " << code << "  " << path << "\n";
      }
      if (xs.empty())
        std::cout << "  (none)\n";
      std::cout << "\n";
    };

    print_changes("Changes to be committed:", st.staged);
    print_changes("Changes not staged for commit:", st.unstaged);

    std::cout << "Untracked files:\n";
    if (st.untracked.empty())
      std::cout << "  (none)\n";
    else
      for (const auto &p : st.untracked)
        std::cout << "  " << p << "\n";
    std::cout << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
