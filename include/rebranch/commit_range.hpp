#pragma once
#include "rebranch/backend.hpp"
#include "rebranch/record.hpp"

#include <string_view>
#include <vector>

namespace rebranch {

// Commits reachable from `head` that are not ancestors of `base`, oldest
// first. Each candidate is tested for ancestry individually, so commits that
// reached base through another path are excluded. Throws ReferenceNotFound.
auto commits_unique_to(const VcsBackend &vcs, std::string_view base, std::string_view head)
    -> std::vector<CommitEntry>;

} // namespace rebranch
