#pragma once
#include <filesystem>
#include <map>
#include <set>
#include <string>

namespace rebranch {

class Repository; // fwd

namespace worktree {

using PathOidMap = std::map<std::string, std::string>; // path -> 40-hex blob id

// Regular files under root, excluding the metadata directory, as repo-relative paths
void enumerate_paths(const std::filesystem::path& root, std::set<std::string>& out_paths);

// path->hex map for working directory contents
auto build_working_map(const std::filesystem::path& root) -> PathOidMap;

// path->hex map from the index file
auto index_to_map(const std::filesystem::path& root) -> PathOidMap;

// path->hex map from a tree object (recursive)
auto tree_to_map(const Repository& repo, const std::string& tree_hex) -> PathOidMap;

// Make the working directory match the snapshot (extra files are removed)
void apply_snapshot(const Repository& repo, const PathOidMap& snapshot);

// Rewrite index entries to match the snapshot
void write_index_snapshot(const Repository& repo, const PathOidMap& snapshot);

} // namespace worktree

} // namespace rebranch
