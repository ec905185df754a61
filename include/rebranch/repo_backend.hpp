#pragma once
#include "rebranch/backend.hpp"
#include "rebranch/repo.hpp"

#include <utility>

namespace rebranch {

// VcsBackend over an on-disk Repository.
class RepositoryBackend final : public VcsBackend {
public:
  explicit RepositoryBackend(Repository repo) : repo_(std::move(repo)) {}

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

private:
  Repository repo_;
};

} // namespace rebranch
