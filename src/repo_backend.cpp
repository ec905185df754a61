#include "rebranch/repo_backend.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/error.hpp"
#include "rebranch/status.hpp"
#include "rebranch/util.hpp"

#include <array>
#include <exception>
#include <utility>

namespace rebranch {

namespace {

// Run a repository call, reporting its failure as BackendFailure with the
// underlying message kept verbatim.
template <typename Fn>
auto guarded(std::string_view what, Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const Error &) {
    throw;
  } catch (const std::exception &e) {
    throw Error(ErrorKind::BackendFailure, std::string(what) + ": " + e.what());
  }
}

struct Marker {
  std::string_view file;
  std::string_view kind;
};

constexpr std::array<Marker, 5> kMarkers{{
    {consts::kRebaseHead, "rebase"},
    {consts::kMergeHead, "merge"},
    {consts::kCherryPickHead, consts::kPickOperation},
    {consts::kRevertHead, "revert"},
    {consts::kStateFile, "rebranch"},
}};

} // namespace

void RepositoryBackend::validate_repository() const {
  if (!repo_.is_initialized()) {
    throw Error(Violation::InvalidRepository,
                "invalid repository: " + repo_.repo_dir().string() + " not found");
  }
  guarded("invalid repository", [&] {
    if (!repo_.head_commit()) {
      throw Error(Violation::InvalidRepository, "invalid repository: HEAD does not name a commit");
    }
  });
}

std::string RepositoryBackend::current_branch() const {
  return guarded("failed to get current branch", [&] {
    auto name = repo_.current_branch();
    if (!name) {
      throw Error(ErrorKind::BackendFailure,
                  "HEAD is not pointing to a branch (detached HEAD state)");
    }
    return std::move(*name);
  });
}

bool RepositoryBackend::branch_exists(std::string_view name) const {
  return guarded("failed to look up branch", [&] { return repo_.branch_tip(name).has_value(); });
}

std::optional<std::string> RepositoryBackend::branch_tip(std::string_view name) const {
  return guarded("failed to look up branch", [&] { return repo_.branch_tip(name); });
}

CommitMeta RepositoryBackend::read_commit(std::string_view id) const {
  return guarded("failed to read commit " + std::string(id), [&] {
    auto info = repo_.read_commit(id);
    return CommitMeta{.id = std::string(id),
                      .parents = std::move(info.parents),
                      .summary = strutil::first_line(info.message)};
  });
}

bool RepositoryBackend::is_ancestor(std::string_view ancestor,
                                    std::string_view descendant) const {
  return guarded("failed to walk history",
                 [&] { return repo_.is_commit_ancestor(ancestor, descendant); });
}

void RepositoryBackend::create_branch(std::string_view name, std::string_view at_base) {
  guarded("failed to create branch " + std::string(name), [&] {
    const auto tip = repo_.branch_tip(at_base);
    if (!tip) {
      throw Error(ErrorKind::ReferenceNotFound,
                  "base branch '" + std::string(at_base) + "' not found");
    }
    repo_.create_branch(name, *tip);
  });
}

void RepositoryBackend::checkout(std::string_view name) {
  guarded("failed to checkout branch " + std::string(name), [&] { repo_.checkout(name); });
}

PickOutcome RepositoryBackend::cherry_pick(std::string_view commit_id) {
  return guarded("failed to cherry-pick " + short_id(commit_id), [&] {
    return repo_.cherry_pick(commit_id).clean() ? PickOutcome::Applied : PickOutcome::Conflict;
  });
}

void RepositoryBackend::cancel_pick() {
  guarded("failed to reset working tree", [&] { repo_.reset_hard(); });
}

void RepositoryBackend::delete_branch(std::string_view name) {
  guarded("failed to delete branch " + std::string(name), [&] { repo_.delete_branch(name); });
}

void RepositoryBackend::rename_branch(std::string_view old_name, std::string_view new_name) {
  guarded("failed to rename " + std::string(old_name) + " to " + std::string(new_name),
          [&] { repo_.rename_branch(old_name, new_name); });
}

bool RepositoryBackend::is_working_tree_clean() const {
  return guarded("failed to check working directory status",
                 [&] { return compute_status(repo_).clean(); });
}

ForeignOperation RepositoryBackend::detect_foreign_operation() const {
  for (const auto &m : kMarkers) {
    if (repo_.has_marker(m.file)) {
      return ForeignOperation{.in_progress = true, .kind = std::string(m.kind)};
    }
  }
  return {};
}

std::filesystem::path RepositoryBackend::metadata_dir() const { return repo_.repo_dir(); }

} // namespace rebranch
