#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rebranch {

// What the core needs to know about a commit.
struct CommitMeta {
  std::string id;                   // 40-hex
  std::vector<std::string> parents; // 40-hex each, first parent first
  std::string summary;              // first line of the message
};

enum class PickOutcome : std::uint8_t { Applied, Conflict };

struct ForeignOperation {
  bool in_progress = false;
  std::string kind; // "merge", "rebase", "cherry-pick", "revert" or "rebranch"
};

// Version-control capability consumed by the workflow. Every method reports
// failure by throwing rebranch::Error; a cherry-pick conflict is an outcome,
// not a failure.
class VcsBackend {
public:
  virtual ~VcsBackend() = default;

  // Throws ValidationFailure/InvalidRepository when HEAD does not resolve.
  virtual void validate_repository() const = 0;

  // Name of the checked-out branch; BackendFailure when HEAD is detached.
  [[nodiscard]] virtual auto current_branch() const -> std::string = 0;
  [[nodiscard]] virtual auto branch_exists(std::string_view name) const -> bool = 0;
  [[nodiscard]] virtual auto branch_tip(std::string_view name) const
      -> std::optional<std::string> = 0;

  // History traversal
  [[nodiscard]] virtual auto read_commit(std::string_view id) const -> CommitMeta = 0;
  [[nodiscard]] virtual auto is_ancestor(std::string_view ancestor,
                                         std::string_view descendant) const -> bool = 0;

  // Mutations
  virtual void create_branch(std::string_view name, std::string_view at_base) = 0;
  virtual void checkout(std::string_view name) = 0;
  [[nodiscard]] virtual auto cherry_pick(std::string_view commit_id) -> PickOutcome = 0;
  // Throw away a stopped pick and any uncommitted changes on the current branch.
  virtual void cancel_pick() = 0;
  virtual void delete_branch(std::string_view name) = 0;
  virtual void rename_branch(std::string_view old_name, std::string_view new_name) = 0;

  // Working tree and in-progress state
  [[nodiscard]] virtual auto is_working_tree_clean() const -> bool = 0;
  [[nodiscard]] virtual auto detect_foreign_operation() const -> ForeignOperation = 0;

  // Private metadata directory holding REBRANCH_STATE and REBRANCH_PICK.
  [[nodiscard]] virtual auto metadata_dir() const -> std::filesystem::path = 0;
};

} // namespace rebranch
