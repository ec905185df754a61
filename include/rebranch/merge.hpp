#pragma once
#include "rebranch/worktree.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rebranch {

class Repository; // fwd

namespace merge {

struct TreeMergeResult {
  // Paths that merged cleanly (path -> 40-hex blob). Conflicted paths are absent.
  worktree::PathOidMap merged;
  // Conflicted path -> file content with conflict markers.
  std::map<std::string, std::string> conflicts;

  [[nodiscard]] bool clean() const { return conflicts.empty(); }
};

// Three-way merge of path->blob maps. A path changed on one side only takes
// that side; identical changes merge; anything else conflicts. `theirs_label`
// follows the ">>>>>>> " marker.
auto merge_trees(const Repository& repo,
                 const worktree::PathOidMap& base,
                 const worktree::PathOidMap& ours,
                 const worktree::PathOidMap& theirs,
                 std::string_view theirs_label) -> TreeMergeResult;

// Hunk-level markers around the region where `ours` and `theirs` differ.
auto conflict_text(std::string_view ours, std::string_view theirs,
                   std::string_view theirs_label) -> std::string;

} // namespace merge

} // namespace rebranch
