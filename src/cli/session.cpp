#include "cli/session.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/error.hpp"
#include "rebranch/git_backend.hpp"
#include "rebranch/repo_backend.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

namespace rebranch::cli {

Session::Session(std::unique_ptr<VcsBackend> vcs, const Settings &settings)
    : backend(std::move(vcs)), store(backend->metadata_dir()), editor(settings.editor),
      workflow(*backend, store, editor, std::cout, std::cerr) {}

std::optional<DiscoveredRepository> discover_backend(const std::filesystem::path &start) {
  std::error_code ec;
  std::filesystem::path dir = std::filesystem::absolute(start, ec);
  if (ec) {
    return std::nullopt;
  }
  for (;;) {
    if (std::filesystem::exists(dir / consts::kRepoDir, ec)) {
      return DiscoveredRepository{.backend = std::make_unique<RepositoryBackend>(Repository{dir}),
                                  .root = dir};
    }
    if (std::filesystem::exists(dir / consts::kGitDir, ec)) {
      return DiscoveredRepository{.backend = std::make_unique<GitCliBackend>(dir), .root = dir};
    }
    const auto parent = dir.parent_path();
    if (parent == dir) {
      return std::nullopt;
    }
    dir = parent;
  }
}

std::unique_ptr<Session> open_session() {
  auto found = discover_backend(std::filesystem::current_path());
  if (!found) {
    throw Error(Violation::InvalidRepository,
                "not a repository (no " + std::string(consts::kRepoDir) + " or " +
                    std::string(consts::kGitDir) + " found in this directory or any parent)");
  }
  const Settings settings = load_settings(found->root);
  return std::make_unique<Session>(std::move(found->backend), settings);
}

std::optional<Repository> open_repository(std::string_view cmd) {
  auto repo = Repository::discover(std::filesystem::current_path());
  if (!repo) {
    std::cerr << cmd << ": not a " << consts::kToolName << " repo (run `" << consts::kToolName
              << " init`)\n";
  }
  return repo;
}

int report_failure(const std::exception &e) {
  std::cerr << "error: " << e.what() << "\n";
  return 1;
}

} // namespace rebranch::cli
