#pragma once
#include "rebranch/backend.hpp"
#include "rebranch/config.hpp"
#include "rebranch/editor.hpp"
#include "rebranch/record.hpp"
#include "rebranch/repo.hpp"
#include "rebranch/workflow.hpp"

#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace rebranch::cli {

// Everything one workflow command needs, wired to the repository that
// contains the current directory. Members refer to each other, so a session
// is never copied or moved.
struct Session {
  Session(std::unique_ptr<VcsBackend> vcs, const Settings &settings);
  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  std::unique_ptr<VcsBackend> backend;
  RecordStore store;
  SystemEditor editor;
  Workflow workflow;
};

// Backend for the nearest enclosing repository: a directory holding
// .rebranch, else one holding .git. Settings come from that directory.
struct DiscoveredRepository {
  std::unique_ptr<VcsBackend> backend;
  std::filesystem::path root;
};
std::optional<DiscoveredRepository> discover_backend(const std::filesystem::path &start);

// Throws Error(InvalidRepository) outside a repository.
std::unique_ptr<Session> open_session();

// Repository containing the current directory; prints "<cmd>: not a rebranch
// repo" and returns nullopt otherwise.
std::optional<Repository> open_repository(std::string_view cmd);

// Print "error: <what>" to stderr and return the exit code for a failed command.
int report_failure(const std::exception &e);

} // namespace rebranch::cli
