#include "rebranch/commit_range.hpp"

#include "rebranch/error.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>

namespace rebranch {

namespace {
std::string resolve(const VcsBackend &vcs, std::string_view branch) {
  auto tip = vcs.branch_tip(branch);
  if (!tip) {
    throw Error(ErrorKind::ReferenceNotFound, "branch '" + std::string(branch) + "' not found");
  }
  return std::move(*tip);
}
} // namespace

std::vector<CommitEntry> commits_unique_to(const VcsBackend &vcs, std::string_view base,
                                           std::string_view head) {
  const std::string base_tip = resolve(vcs, base);
  const std::string head_tip = resolve(vcs, head);

  std::vector<CommitEntry> ordered;
  if (base_tip == head_tip) {
    return ordered;
  }

  // Everything reachable from head that base cannot reach. An ancestor of
  // base ends its path: all of its own ancestors are ancestors of base too.
  std::map<std::string, CommitMeta> candidates;
  std::vector<std::string> stack{head_tip};
  while (!stack.empty()) {
    std::string id = std::move(stack.back());
    stack.pop_back();
    if (candidates.contains(id) || vcs.is_ancestor(id, base_tip)) {
      continue;
    }
    auto meta = vcs.read_commit(id);
    stack.insert(stack.end(), meta.parents.begin(), meta.parents.end());
    candidates.emplace(std::move(id), std::move(meta));
  }
  if (!candidates.contains(head_tip)) {
    return ordered; // head is already part of base
  }

  // Post-order from head: parents before children, so oldest first.
  std::set<std::string> entered{head_tip};
  std::vector<std::pair<std::string, std::size_t>> walk{{head_tip, 0}};
  while (!walk.empty()) {
    const std::string id = walk.back().first;
    const std::size_t next = walk.back().second;
    const auto &meta = candidates.at(id);
    if (next < meta.parents.size()) {
      ++walk.back().second;
      const std::string &parent = meta.parents[next];
      if (candidates.contains(parent) && entered.insert(parent).second) {
        walk.emplace_back(parent, 0);
      }
      continue;
    }
    walk.pop_back();
    ordered.push_back(CommitEntry{.id = meta.id, .summary = meta.summary, .action = Action::Apply});
  }
  return ordered;
}

} // namespace rebranch
