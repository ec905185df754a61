#pragma once
#include "rebranch/config.hpp"
#include "rebranch/consts.hpp"
#include "rebranch/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rebranch {

struct TreeEntry {
  std::uint32_t mode; // e.g., rebranch::consts::kModeFile file, 040000 dir (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

struct PickResult {
  std::string new_commit;             // empty when nothing was committed
  std::vector<std::string> conflicts; // paths left with conflict markers

  [[nodiscard]] bool clean() const { return conflicts.empty(); }
};

class Repository {
public:
  explicit Repository(std::filesystem::path root);

  // Walk up from `start` to the first directory holding .rebranch.
  [[nodiscard]] static auto discover(const std::filesystem::path &start)
      -> std::optional<Repository>;

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto repo_dir() const -> std::filesystem::path { return root_ / consts::kRepoDir; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return repo_dir() / consts::kObjectsDir;
  }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return repo_dir() / consts::kRefsDir / consts::kHeadsDir;
  }
  [[nodiscard]] auto head_file() const -> std::filesystem::path {
    return repo_dir() / consts::kHeadFile;
  }

  // Create the repository structure under root_.
  // Fails if .rebranch already exists (to avoid clobber).
  void init(const Identity &identity = Identity{.name = "Your Name",
                                                .email = "you@example.com"}) const;

  [[nodiscard]] auto is_initialized() const -> bool;

  // Object plumbing
  [[nodiscard]] auto write_blob(std::span<const std::uint8_t> bytes) const -> std::string;
  std::vector<std::uint8_t> read_blob(std::string_view hex_oid) const;

  [[nodiscard]] auto write_tree(const std::vector<TreeEntry> &entries) const -> std::string;
  std::vector<TreeEntry> read_tree(std::string_view hex_oid) const;

  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::vector<std::string> &parent_hexes,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;

  struct CommitInfo {
    std::string tree_hex;
    std::vector<std::string> parents; // zero or more parents (40-hex each)
    std::string author;               // full author line after "author "
    std::string committer;            // full committer line
    std::string message;              // raw message (may contain newlines)
  };

  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  // Graph query: is `ancestor_hex` an ancestor of `descendant_hex`?
  // Includes equality (a commit is an ancestor of itself).
  [[nodiscard]] auto is_commit_ancestor(std::string_view ancestor_hex,
                                        std::string_view descendant_hex) const -> bool;

  [[nodiscard]] auto write_tree_from_index() const -> std::string;

  // Commit the index on top of HEAD. With CHERRY_PICK_HEAD present the
  // index must hold every path (conflicts resolved); the marker is cleared.
  [[nodiscard]] auto commit_index(std::string_view message) const -> std::string;

  // Branches
  [[nodiscard]] auto current_branch() const -> std::optional<std::string>;
  [[nodiscard]] auto head_commit() const -> std::optional<std::string>;
  [[nodiscard]] auto branch_tip(std::string_view branch) const -> std::optional<std::string>;
  void create_branch(std::string_view branch, std::string_view commit_hex) const;
  void delete_branch(std::string_view branch) const;
  void rename_branch(std::string_view old_name, std::string_view new_name) const;

  // Switch work tree, index and HEAD to a branch. Refuses with unstaged changes.
  void checkout(std::string_view branch) const;

  // Replay one commit onto the checked-out branch. On conflicts the work
  // tree holds markers, the index omits those paths and CHERRY_PICK_HEAD is set.
  [[nodiscard]] auto cherry_pick(std::string_view commit_hex) const -> PickResult;

  // Drop all uncommitted state: work tree and index back to HEAD, pick marker
  // removed. Untracked files are removed as well.
  void reset_hard() const;

  [[nodiscard]] auto has_marker(std::string_view name) const -> bool;

private:
  [[nodiscard]] auto commit_tree_map(std::string_view commit_hex) const
      -> std::map<std::string, std::string>;
  void require_initialized() const;

  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  std::filesystem::path root_;
};

} // namespace rebranch
