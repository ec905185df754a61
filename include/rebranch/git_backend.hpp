#pragma once
#include "rebranch/backend.hpp"
#include "rebranch/process.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace rebranch {

// VcsBackend over a git work tree, driving the `git` command line.
// REBRANCH_STATE and REBRANCH_PICK live in the git directory.
class GitCliBackend final : public VcsBackend {
public:
  // `work_tree` is the directory holding `.git`.
  explicit GitCliBackend(std::filesystem::path work_tree);

  void validate_repository() const override;
  [[nodiscard]] auto current_branch() const -> std::string override;
  [[nodiscard]] auto branch_exists(std::string_view name) const -> bool override;
  [[nodiscard]] auto branch_tip(std::string_view name) const
      -> std::optional<std::string> override;
  [[nodiscard]] auto read_commit(std::string_view id) const -> CommitMeta override;
  [[nodiscard]] auto is_ancestor(std::string_view ancestor,
                                 std::string_view descendant) const -> bool override;
  void create_branch(std::string_view name, std::string_view at_base) override;
  void checkout(std::string_view name) override;
  [[nodiscard]] auto cherry_pick(std::string_view commit_id) -> PickOutcome override;
  void cancel_pick() override;
  void delete_branch(std::string_view name) override;
  void rename_branch(std::string_view old_name, std::string_view new_name) override;
  [[nodiscard]] auto is_working_tree_clean() const -> bool override;
  [[nodiscard]] auto detect_foreign_operation() const -> ForeignOperation override;
  [[nodiscard]] auto metadata_dir() const -> std::filesystem::path override;

  [[nodiscard]] const std::filesystem::path &work_tree() const { return root_; }

private:
  // Run `git <args>` in the work tree. Only a failure to run git at all throws.
  [[nodiscard]] auto git(std::vector<std::string> args) const -> process::Result;
  // Like git(), but a non-zero exit is a BackendFailure prefixed with `what`.
  auto git_checked(const std::string &what, std::vector<std::string> args) const -> std::string;

  std::filesystem::path root_;
  std::filesystem::path git_dir_;
};

} // namespace rebranch
