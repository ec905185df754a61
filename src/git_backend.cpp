#include "rebranch/git_backend.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/error.hpp"
#include "rebranch/fs.hpp"
#include "rebranch/util.hpp"

#include <array>
#include <exception>
#include <sstream>
#include <utility>

namespace stdfs = std::filesystem;
namespace rfs   = rebranch::fs;

namespace rebranch {

namespace {

struct Marker {
  std::string_view file;
  std::string_view kind;
};

constexpr std::array<Marker, 7> kMarkers{{
    {consts::kRebaseHead, "rebase"},
    {consts::kRebaseMergeDir, "rebase"},
    {consts::kRebaseApplyDir, "rebase"},
    {consts::kMergeHead, "merge"},
    {consts::kCherryPickHead, consts::kPickOperation},
    {consts::kRevertHead, "revert"},
    {consts::kStateFile, "rebranch"},
}};

std::string chomp(std::string s) {
  strutil::rstrip_newlines(s);
  return s;
}

// Linked work trees and submodules have a ".git" file reading "gitdir: <path>".
stdfs::path resolve_git_dir(const stdfs::path &root) {
  const stdfs::path dot_git = root / consts::kGitDir;
  std::error_code ec;
  if (!stdfs::is_regular_file(dot_git, ec)) {
    return dot_git;
  }
  const std::string text = chomp(rfs::read_text(dot_git));
  constexpr std::string_view kPrefix = "gitdir: ";
  if (!text.starts_with(kPrefix)) {
    return dot_git;
  }
  stdfs::path target = text.substr(kPrefix.size());
  if (target.is_relative()) {
    target = root / target;
  }
  return target.lexically_normal();
}

std::string failure_text(const std::string &what, const process::Result &r) {
  std::string detail = chomp(r.err.empty() ? r.out : r.err);
  if (detail.empty()) {
    detail = "git exited with status " + std::to_string(r.exit_code);
  }
  return what + ": " + detail;
}

} // namespace

GitCliBackend::GitCliBackend(stdfs::path work_tree)
    : root_(std::move(work_tree)), git_dir_(resolve_git_dir(root_)) {}

process::Result GitCliBackend::git(std::vector<std::string> args) const {
  args.insert(args.begin(), "git");
  process::Result r;
  try {
    r = process::run(args, root_);
  } catch (const std::exception &e) {
    throw Error(ErrorKind::BackendFailure, std::string("failed to run git: ") + e.what());
  }
  if (r.exit_code == 127 && r.err.empty()) {
    throw Error(ErrorKind::BackendFailure, "failed to run git: not found in PATH");
  }
  return r;
}

std::string GitCliBackend::git_checked(const std::string &what,
                                       std::vector<std::string> args) const {
  auto r = git(std::move(args));
  if (!r.ok()) {
    throw Error(ErrorKind::BackendFailure, failure_text(what, r));
  }
  return std::move(r.out);
}

void GitCliBackend::validate_repository() const {
  std::error_code ec;
  if (!stdfs::exists(git_dir_, ec)) {
    throw Error(Violation::InvalidRepository, "not a git repository (no .git directory found)");
  }
  if (!git({"rev-parse", "-q", "--verify", "HEAD^{commit}"}).ok()) {
    throw Error(Violation::InvalidRepository,
                "invalid git repository: HEAD does not name a commit");
  }
}

std::string GitCliBackend::current_branch() const {
  const auto r = git({"symbolic-ref", "-q", "--short", "HEAD"});
  if (r.exit_code == 1) {
    throw Error(ErrorKind::BackendFailure,
                "HEAD is not pointing to a branch (detached HEAD state)");
  }
  if (!r.ok()) {
    throw Error(ErrorKind::BackendFailure, failure_text("failed to get current branch", r));
  }
  return chomp(r.out);
}

bool GitCliBackend::branch_exists(std::string_view name) const {
  return branch_tip(name).has_value();
}

std::optional<std::string> GitCliBackend::branch_tip(std::string_view name) const {
  const auto r =
      git({"rev-parse", "-q", "--verify", "refs/heads/" + std::string(name) + "^{commit}"});
  if (!r.ok()) {
    return std::nullopt;
  }
  return chomp(r.out);
}

CommitMeta GitCliBackend::read_commit(std::string_view id) const {
  const std::string raw =
      git_checked("failed to read commit " + std::string(id), {"cat-file", "commit", std::string(id)});

  // Header lines up to the first blank line, then the message
  CommitMeta meta{.id = std::string(id), .parents = {}, .summary = {}};
  const auto blank = raw.find("\n\n");
  std::istringstream headers(raw.substr(0, blank));
  std::string line;
  while (std::getline(headers, line)) {
    if (line.starts_with(consts::kParentPrefix)) {
      meta.parents.push_back(line.substr(consts::kParentPrefix.size()));
    }
  }
  if (blank != std::string::npos) {
    meta.summary = strutil::first_line(std::string_view(raw).substr(blank + 2));
  }
  return meta;
}

bool GitCliBackend::is_ancestor(std::string_view ancestor, std::string_view descendant) const {
  const auto r =
      git({"merge-base", "--is-ancestor", std::string(ancestor), std::string(descendant)});
  if (r.exit_code == 0 || r.exit_code == 1) {
    return r.exit_code == 0;
  }
  throw Error(ErrorKind::BackendFailure, failure_text("failed to walk history", r));
}

void GitCliBackend::create_branch(std::string_view name, std::string_view at_base) {
  const auto tip = branch_tip(at_base);
  if (!tip) {
    throw Error(ErrorKind::ReferenceNotFound,
                "base branch '" + std::string(at_base) + "' not found");
  }
  (void)git_checked("failed to create branch " + std::string(name),
                    {"branch", "--no-track", std::string(name), *tip});
}

void GitCliBackend::checkout(std::string_view name) {
  (void)git_checked("failed to checkout branch " + std::string(name),
                    {"checkout", "-q", std::string(name), "--"});
}

PickOutcome GitCliBackend::cherry_pick(std::string_view commit_id) {
  const std::string id(commit_id);
  std::vector<std::string> args{"cherry-pick", "--allow-empty"};
  if (read_commit(id).parents.size() > 1) {
    // Replay a merge as its change against the first parent
    args.insert(args.end(), {"-m", "1"});
  }
  args.push_back(id);

  const auto r = git(std::move(args));
  if (r.ok()) {
    return PickOutcome::Applied;
  }
  std::error_code ec;
  if (!stdfs::exists(git_dir_ / consts::kCherryPickHead, ec)) {
    throw Error(ErrorKind::BackendFailure, failure_text("failed to cherry-pick " + short_id(id), r));
  }
  // Nothing left to commit: the change is already on this branch
  if (is_working_tree_clean()) {
    (void)git_checked("failed to skip empty cherry-pick of " + short_id(id),
                      {"cherry-pick", "--skip"});
    return PickOutcome::Applied;
  }
  return PickOutcome::Conflict;
}

void GitCliBackend::cancel_pick() {
  // reset --hard also drops CHERRY_PICK_HEAD
  (void)git_checked("failed to reset working tree", {"reset", "-q", "--hard", "HEAD"});
}

void GitCliBackend::delete_branch(std::string_view name) {
  (void)git_checked("failed to delete branch " + std::string(name),
                    {"branch", "-D", std::string(name)});
}

void GitCliBackend::rename_branch(std::string_view old_name, std::string_view new_name) {
  (void)git_checked("failed to rename " + std::string(old_name) + " to " + std::string(new_name),
                    {"branch", "-m", std::string(old_name), std::string(new_name)});
}

bool GitCliBackend::is_working_tree_clean() const {
  return git_checked("failed to check working directory status",
                     {"status", "--porcelain", "--untracked-files=normal"})
      .empty();
}

ForeignOperation GitCliBackend::detect_foreign_operation() const {
  std::error_code ec;
  for (const auto &m : kMarkers) {
    if (stdfs::exists(git_dir_ / m.file, ec)) {
      return ForeignOperation{.in_progress = true, .kind = std::string(m.kind)};
    }
  }
  return {};
}

stdfs::path GitCliBackend::metadata_dir() const { return git_dir_; }

} // namespace rebranch
