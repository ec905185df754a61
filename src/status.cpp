#include "rebranch/status.hpp"

#include "rebranch/repo.hpp"
#include "rebranch/worktree.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace rebranch {

namespace {

using PathMap = std::map<std::string, std::string>;

// Changes taking `from` to `to`.
void diff_maps(const PathMap &from, const PathMap &to, std::vector<Change> &out) {
  std::set<std::string> all;
  for (const auto &[p, _] : from) {
    all.insert(p);
  }
  for (const auto &[p, _] : to) {
    all.insert(p);
  }
  for (const auto &path : all) {
    const auto it_f = from.find(path);
    const auto it_t = to.find(path);
    const bool in_f = it_f != from.end();
    const bool in_t = it_t != to.end();
    if (in_f && in_t) {
      if (it_f->second != it_t->second) {
        out.push_back({ChangeKind::Modified, path});
      }
    } else if (in_t) {
      out.push_back({ChangeKind::Added, path});
    } else {
      out.push_back({ChangeKind::Deleted, path});
    }
  }
}

} // namespace

Status compute_status(const Repository &repo) {
  PathMap head_map; // empty for a branch without commits
  if (const auto head = repo.head_commit()) {
    head_map = worktree::tree_to_map(repo, repo.read_commit(*head).tree_hex);
  }
  const PathMap index_map = worktree::index_to_map(repo.root());
  const PathMap work_map = worktree::build_working_map(repo.root());

  Status st;
  diff_maps(head_map, index_map, st.staged);

  // working vs index: files only in the working tree are untracked, not added
  PathMap tracked_work;
  for (const auto &[p, hex] : work_map) {
    if (index_map.contains(p)) {
      tracked_work.emplace(p, hex);
    } else {
      st.untracked.push_back(p);
    }
  }
  diff_maps(index_map, tracked_work, st.unstaged);
  std::ranges::sort(st.untracked);
  return st;
}

} // namespace rebranch
