#include "cli/session.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/index.hpp"
#include "rebranch/repo.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

// Stage a single work-tree path. A tracked path that no longer exists is
// staged as a deletion.
static auto add_one(rebranch::Index &idx, const rebranch::Repository &repo,
                    const fs::path &relpath) -> bool {
  const auto rel = relpath.generic_string();
  const fs::path abs = repo.root() / relpath;
  if (!fs::exists(abs) && idx.remove_path(rel)) {
    std::cout << "removed: " << rel << "\n";
    return true;
  }
  if (!fs::exists(abs) || !fs::is_regular_file(abs)) {
    std::cerr << "add: skipping non-regular file: " << relpath << "\n";
    return false;
  }
  idx.add_path(repo.root(), rel, repo, rebranch::consts::kModeFile);
  std::cout << "added: " << rel << "\n";
  return true;
}

int cmd_add(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: rebranch add <path> [<path> ...]\n";
    return 2;
  }

  const auto repo = rebranch::cli::open_repository("add");
  if (!repo) {
    return 1;
  }

  try {
    // Collect unique repo-relative paths while preserving order
    std::vector<fs::path> paths;
    paths.reserve(static_cast<std::size_t>(argc) - 1);
    for (int i = 1; i < argc; ++i) {
      fs::path path = fs::relative(fs::absolute(argv[i]), repo->root());
      if (path.empty() || *path.begin() == "..") {
        std::cerr << "add: outside repository: " << argv[i] << "\n";
        return 1;
      }
      if (std::ranges::find(paths, path) == paths.end()) {
        paths.push_back(std::move(path));
      }
    }

    rebranch::Index idx{repo->root()};
    idx.load();
    bool any = false;
    for (const auto &path : paths) {
      any = add_one(idx, *repo, path) || any;
    }
    if (any) {
      idx.save();
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "add: " << e.what() << "\n";
    return 1;
  }
}
